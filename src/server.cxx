#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "server.hxx"
#include "clients/fleet_client.hxx"
#include "clients/maps_client.hxx"
#include "clients/weather_client.hxx"
#include "engine.hxx"
#include "file_reader.hxx"
#include "memory_store.hxx"
#include "road_network.hxx"
#include "sqlite_store.hxx"
#include "transportation/serialization.hxx"
#include <Poco/Net/NetSSL.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/IntValidator.h>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <loadplan/loadplan.hxx>
#include <memory>
#include <unordered_map>

namespace loadplan {

namespace {
// Option name -> configuration key it overrides.
const std::unordered_map<std::string, std::string> OPTION_KEYS{
  { "orders", "orders.file" },       { "fleet", "fleet.file" },
  { "network", "network.file" },     { "output", "output.file" },
  { "store", "store.sqlite" },       { "time-limit", "solver.time_limit_ms" },
};
} // namespace

void
LoadPlanner::display_help()
{
  Poco::Util::HelpFormatter helpFormatter(options());
  helpFormatter.setCommand(commandName());
  helpFormatter.setUsage("OPTIONS");
  helpFormatter.setHeader(fmt::format(
    "{}: assigns pending orders to trucks and trailers along profitable "
    "routes",
    usage()));
  helpFormatter.format(std::cout);
}

void
LoadPlanner::initialize(Poco::Util::Application& self)
{
  loadConfiguration();
  Poco::Util::Application::initialize(self);
  Poco::Net::initializeSSL();
  logger().debug("Starting up");
}

void
LoadPlanner::uninitialize()
{
  logger().debug("Shutting down");
  Poco::Net::uninitializeSSL();
  Poco::Util::Application::uninitialize();
}

void
LoadPlanner::defineOptions(Poco::Util::OptionSet& options)
{
  Poco::Util::Application::defineOptions(options);

  options.addOption(
    Poco::Util::Option(
      "help", "h", "display help information on command line arguments")
      .required(false)
      .repeatable(false)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::handle_help)));

  options.addOption(
    Poco::Util::Option("config", "c", "Load configuration from a file")
      .required(false)
      .repeatable(true)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::handle_config)));

  options.addOption(
    Poco::Util::Option("orders", "o", "Orders data file (JSON)")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));

  options.addOption(
    Poco::Util::Option("fleet", "f", "Fleet snapshot file instead of the API")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));

  options.addOption(
    Poco::Util::Option("network", "n", "Known locations and road legs (JSON)")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));

  options.addOption(
    Poco::Util::Option("output", "w", "Write the result JSON to a file")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));

  options.addOption(
    Poco::Util::Option("store", "s", "SQLite database receiving assignments")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));

  options.addOption(
    Poco::Util::Option("time-limit", "t", "Solver budget in milliseconds")
      .required(false)
      .repeatable(false)
      .argument("<millis>", true)
      .validator(new Poco::Util::IntValidator(1, 3600000))
      .callback(Poco::Util::OptionCallback<LoadPlanner>(
        this, &LoadPlanner::set_property)));
}

void
LoadPlanner::handle_help(const std::string& name, const std::string& value)
{
  mHelpRequested = true;
  display_help();
  stopOptionsProcessing();
}

void
LoadPlanner::handle_config(const std::string& name, const std::string& value)
{
  loadConfiguration(value);
}

void
LoadPlanner::set_property(const std::string& name, const std::string& value)
{
  config().setString(OPTION_KEYS.at(name), value);
}

auto
LoadPlanner::main(const ArgVec& args) -> int
{
  if (mHelpRequested) {
    return EXIT_OK;
  }

  EngineConfig engineConfig;

  try {
    engineConfig = EngineConfig::from(config());
    engineConfig.validate();
  } catch (const ConfigurationError& exc) {
    logger().error(exc.what());
    return EXIT_CONFIG;
  }
  engineConfig.log(logger());

  auto ordersFile = config().getString("orders.file", "");

  if (ordersFile.empty()) {
    logger().error("No orders file given, see --help");
    return EXIT_USAGE;
  }

  std::vector<Order> orders;
  std::unique_ptr<FleetRegistry> fleet;
  std::unique_ptr<AssignmentStore> store;
  std::unique_ptr<MappingService> maps;
  std::unique_ptr<WeatherService> weather;
  auto network = RoadNetwork::with_defaults();

  try {
    orders = read_orders(ordersFile);

    if (auto fleetFile = config().getString("fleet.file", "");
        not fleetFile.empty()) {
      fleet = std::make_unique<FileFleetRegistry>(fleetFile);
    } else {
      fleet = std::make_unique<SamsaraFleetClient>(
        config().getString("fleet.uri", SamsaraFleetClient::DEFAULT_URI),
        config().getString("fleet.token", ""));
    }

    if (auto networkFile = config().getString("network.file", "");
        not networkFile.empty()) {
      for (const auto& document : read_documents(networkFile)) {
        network.load(document);
      }
    }

    if (auto database = config().getString("store.sqlite", "");
        not database.empty()) {
      store = std::make_unique<SqliteAssignmentStore>(database);
    } else {
      logger().information("No store configured, assignments kept in memory");
      store = std::make_unique<MemoryAssignmentStore>();
    }

    if (auto key = config().getString("maps.key", ""); not key.empty()) {
      maps = std::make_unique<GoogleMapsClient>(
        config().getString("maps.uri", GoogleMapsClient::DEFAULT_URI), key);
    } else {
      logger().warning("No maps key configured, distances are estimated");
      maps = std::make_unique<UnavailableMapping>();
    }

    weather = std::make_unique<OpenWeatherClient>(
      config().getString("weather.uri", OpenWeatherClient::DEFAULT_URI),
      config().getString("weather.key", ""));
  } catch (const ConfigurationError& exc) {
    logger().error(exc.what());
    return EXIT_CONFIG;
  } catch (const Error& exc) {
    logger().error(exc.what());
    return EXIT_IOERR;
  }

  OptimizationEngine engine(
    *fleet, *maps, *weather, network, *store, engineConfig);
  auto result = engine.optimize(orders);

  std::cout << result.summary();

  nlohmann::json output = result;
  auto outputFile = config().getString("output.file", "");

  if (outputFile.empty()) {
    std::cout << output.dump(2) << std::endl;
    return EXIT_OK;
  }

  std::ofstream outFile(outputFile);

  if (not(outFile << output.dump(2) << std::endl)) {
    logger().error(fmt::format("Unable to write {}", outputFile));
    return EXIT_IOERR;
  }
  return EXIT_OK;
}

} // namespace loadplan

auto
main(int argc, char** argv) -> int
{
  loadplan::LoadPlanner app;
  return app.run(argc, argv);
}
