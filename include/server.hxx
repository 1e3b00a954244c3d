#ifndef LOADPLAN_SERVER
#define LOADPLAN_SERVER

#include <Poco/Util/Application.h>
#include <string>

namespace loadplan {

/**
 * @brief Command line runner: one optimisation batch per invocation.
 * @details Options are stored into the application configuration so that
 * they override the same keys of the configuration file.
 */
class LoadPlanner : public Poco::Util::Application
{
private:
  bool mHelpRequested = false;

  void display_help();

protected:
  void initialize(Poco::Util::Application&) override;

  void uninitialize() override;

  void defineOptions(Poco::Util::OptionSet&) override;

  void handle_help(const std::string&, const std::string&);

  void handle_config(const std::string&, const std::string&);

  void set_property(const std::string&, const std::string&);

  auto main(const ArgVec&) -> int override;

public:
  LoadPlanner() = default;

  ~LoadPlanner() override = default;
};

} // namespace loadplan

#endif
