#include "file_reader.hxx"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace loadplan {
namespace {

class FileReaderTest : public ::testing::Test
{
protected:
  std::filesystem::path dir;

  void SetUp() override
  {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = std::filesystem::temp_directory_path() /
          (std::string("loadplan-") + info->name());
    std::filesystem::create_directories(dir);
  }

  void TearDown() override { std::filesystem::remove_all(dir); }

  auto write(const std::string& name, const std::string& content)
    -> std::filesystem::path
  {
    auto path = dir / name;
    std::ofstream(path) << content;
    return path;
  }
};

TEST_F(FileReaderTest, ReadsOrderArray)
{
  auto path = write("orders.json", R"([
    {"id": "O-1", "ship_from": "Winnipeg", "ship_to": "Brandon", "weight_kg": 100},
    {"id": "O-2", "ship_from": "Winnipeg", "ship_to": "Gimli", "weight_kg": 250,
     "priority": "low"}
  ])");

  auto orders = read_orders(path);

  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[1].id, "O-2");
  EXPECT_EQ(orders[1].priority, Priority::LOW);
}

TEST_F(FileReaderTest, ReadsNewlineSeparatedDocuments)
{
  auto path = write("orders.ndjson",
                    "{\"id\": \"O-1\", \"ship_from\": \"A\", \"ship_to\": \"B\", "
                    "\"weight_kg\": 1}\n"
                    "{\"id\": \"O-2\", \"ship_from\": \"A\", \"ship_to\": \"C\", "
                    "\"weight_kg\": 2}\n\n");

  EXPECT_EQ(read_documents(path).size(), 2u);
  EXPECT_EQ(read_orders(path)[1].ship_to, "C");
}

TEST_F(FileReaderTest, ReportsBadInput)
{
  EXPECT_THROW(read_documents(dir / "missing.json"), Error);
  EXPECT_THROW(read_documents(write("broken.json", "[{\"id\": ")), Error);
  EXPECT_THROW(read_orders(write("partial.json", R"([{"id": "O-1"}])")), Error);
}

TEST_F(FileReaderTest, ReadsFleetSnapshot)
{
  auto path = write("fleet.json", R"({
    "trucks": [{"id": "T-1", "warehouse": "Winnipeg", "driver": "Ana"}],
    "trailers": [
      {"id": "TR-1", "warehouse": "Winnipeg", "max_weight_kg": 2000},
      {"id": "TR-2", "warehouse": "Brandon", "max_weight_kg": 9000,
       "refrigerated": true}
    ]
  })");

  FileFleetRegistry fleet(path);

  ASSERT_EQ(fleet.list_available_trucks().size(), 1u);
  EXPECT_EQ(fleet.list_available_trucks()[0].driver, "Ana");
  ASSERT_EQ(fleet.list_available_trailers().size(), 2u);
  EXPECT_TRUE(fleet.list_available_trailers()[1].has(Trailer::REFRIGERATED));

  EXPECT_THROW((FileFleetRegistry{ write("bad-fleet.json", R"({"trucks": [{}]})") }),
               Error);
}

} // namespace
} // namespace loadplan
