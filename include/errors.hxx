#ifndef LOADPLAN_ERRORS
#define LOADPLAN_ERRORS

#include <stdexcept>
#include <string>

namespace loadplan {

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Raised by collaborators (mapping, weather, fleet registry) on any I/O or
// decoding failure. The engine degrades instead of propagating it.
class ServiceUnavailable : public Error
{
public:
  using Error::Error;
};

class ConfigurationError : public Error
{
public:
  using Error::Error;
};

class StoreError : public Error
{
public:
  using Error::Error;
};

} // namespace loadplan

#endif
