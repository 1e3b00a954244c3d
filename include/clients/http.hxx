#ifndef LOADPLAN_CLIENTS_HTTP
#define LOADPLAN_CLIENTS_HTTP

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include <Poco/URI.h>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace loadplan {

/**
 * @brief GET a JSON document over HTTP or HTTPS, chosen by the URI scheme.
 * @param[in] : Full request URI, query included
 * @param[in] : Service name used in error messages
 * @throws ServiceUnavailable on transport errors, non-200 answers and
 * undecodable bodies.
 */
auto
get_json(const Poco::URI&, std::string_view) -> nlohmann::json;

// Parses a configured service base address, ConfigurationError when malformed.
auto
base_uri(const std::string&) -> Poco::URI;

} // namespace loadplan

#endif
