#include "clients/http.hxx"
#include "errors.hxx"
#include <Poco/Exception.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Timespan.h>
#include <fmt/format.h>
#include <memory>

namespace loadplan {

namespace {
constexpr long TIMEOUT_SECONDS = 30;

auto
session_for(const Poco::URI& uri) -> std::unique_ptr<Poco::Net::HTTPClientSession>
{
  if (uri.getScheme() == "https") {
    Poco::Net::Context::Ptr context =
      new Poco::Net::Context(Poco::Net::Context::TLS_CLIENT_USE,
                             "",
                             Poco::Net::Context::VERIFY_RELAXED,
                             9,
                             true);
    return std::make_unique<Poco::Net::HTTPSClientSession>(
      uri.getHost(), uri.getPort(), context);
  }
  return std::make_unique<Poco::Net::HTTPClientSession>(uri.getHost(),
                                                        uri.getPort());
}
} // namespace

auto
base_uri(const std::string& uri) -> Poco::URI
{
  try {
    Poco::URI parsed(uri);

    if (parsed.getHost().empty()) {
      throw ConfigurationError(fmt::format("Service URI {} has no host", uri));
    }
    return parsed;
  } catch (const Poco::SyntaxException& exc) {
    throw ConfigurationError(
      fmt::format("Malformed service URI {}: {}", uri, exc.displayText()));
  }
}

auto
get_json(const Poco::URI& uri, std::string_view service) -> nlohmann::json
{
  try {
    auto session = session_for(uri);
    session->setTimeout(Poco::Timespan(TIMEOUT_SECONDS, 0));

    std::string path(uri.getPathAndQuery());

    if (path.empty()) {
      path = "/";
    }

    Poco::Net::HTTPRequest request(Poco::Net::HTTPRequest::HTTP_GET,
                                   path,
                                   Poco::Net::HTTPMessage::HTTP_1_1);
    request.set("Accept", "application/json");
    session->sendRequest(request);

    Poco::Net::HTTPResponse response;
    std::istream& responseStream = session->receiveResponse(response);

    if (response.getStatus() != Poco::Net::HTTPResponse::HTTP_OK) {
      throw ServiceUnavailable(fmt::format("{} answered {} {}",
                                           service,
                                           static_cast<int>(response.getStatus()),
                                           response.getReason()));
    }
    return nlohmann::json::parse(responseStream);
  } catch (const Poco::Exception& exc) {
    throw ServiceUnavailable(
      fmt::format("{} request failed: {}", service, exc.displayText()));
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(
      fmt::format("{} sent an undecodable body: {}", service, exc.what()));
  }
}

} // namespace loadplan
