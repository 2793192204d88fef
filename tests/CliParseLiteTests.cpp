#include "cli/CliParse.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void TestParseI32()
{
  using namespace parcelcity::cli;

  int v = 0;
  EXPECT_TRUE(ParseI32("0", &v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseI32("-1", &v));
  EXPECT_EQ(v, -1);
  EXPECT_TRUE(ParseI32("+7", &v));
  EXPECT_EQ(v, 7);

  // Leading/trailing junk should fail.
  EXPECT_FALSE(ParseI32("1.0", &v));
  EXPECT_FALSE(ParseI32("1 ", &v));
  EXPECT_FALSE(ParseI32(" 1", &v));
  EXPECT_FALSE(ParseI32("1a", &v));
  EXPECT_FALSE(ParseI32("", &v));
  EXPECT_FALSE(ParseI32("+", &v));
  EXPECT_EQ(v, 7);

  // Overflow should fail.
  EXPECT_FALSE(ParseI32("2147483648", &v));
  EXPECT_FALSE(ParseI32("-2147483649", &v));
  EXPECT_FALSE(ParseI32("6", nullptr));
}

static void TestSplitCommaList()
{
  using namespace parcelcity::cli;

  {
    const auto v = SplitCommaList("a,b,c");
    ASSERT_TRUE(v.size() == 3);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "b");
    EXPECT_EQ(v[2], "c");
  }

  {
    // Whitespace is dropped, empty fields are kept so callers can reject them.
    const auto v = SplitCommaList(" 2 , 3,,road ");
    ASSERT_TRUE(v.size() == 4);
    EXPECT_EQ(v[0], "2");
    EXPECT_EQ(v[1], "3");
    EXPECT_EQ(v[2], "");
    EXPECT_EQ(v[3], "road");
  }

  {
    const auto v = SplitCommaList("");
    ASSERT_TRUE(v.size() == 1);
    EXPECT_TRUE(v[0].empty());
  }
}

static void TestParsePlacement()
{
  using namespace parcelcity::cli;

  int x = -9;
  int y = -9;
  std::string type;

  EXPECT_TRUE(ParsePlacement("2,3,residential", &x, &y, &type));
  EXPECT_EQ(x, 2);
  EXPECT_EQ(y, 3);
  EXPECT_EQ(type, "residential");

  EXPECT_TRUE(ParsePlacement("0, +1, road", &x, &y, &type));
  EXPECT_EQ(x, 0);
  EXPECT_EQ(y, 1);
  EXPECT_EQ(type, "road");

  // Negative coordinates parse; bounds are checked by the city.
  EXPECT_TRUE(ParsePlacement("-1,0,road", &x, &y, &type));
  EXPECT_EQ(x, -1);

  EXPECT_FALSE(ParsePlacement("1,2", &x, &y, &type));
  EXPECT_FALSE(ParsePlacement("1,2,", &x, &y, &type));
  EXPECT_FALSE(ParsePlacement("a,2,road", &x, &y, &type));
  EXPECT_FALSE(ParsePlacement("1,2,road,extra", &x, &y, &type));
  EXPECT_FALSE(ParsePlacement("1,2,road", nullptr, &y, &type));
  EXPECT_EQ(x, -1);
  EXPECT_EQ(type, "road");
}

static void TestEnsureParentDir()
{
  using namespace parcelcity::cli;

  std::error_code ec;
  const fs::path base = MakeTempPath("parcelcity_cli_parse_dirs");

  EXPECT_FALSE(EnsureParentDir(fs::path{}));
  EXPECT_TRUE(EnsureParentDir(fs::path("plain.json")));

  const fs::path file = base / "c" / "d" / "out.txt";
  EXPECT_TRUE(EnsureParentDir(file));
  EXPECT_TRUE(fs::exists(base / "c" / "d"));
  EXPECT_FALSE(fs::exists(file));

  fs::remove_all(base, ec);
}

int main()
{
  TestParseI32();
  TestSplitCommaList();
  TestParsePlacement();
  TestEnsureParentDir();

  if (g_failures == 0) {
    std::cout << "cli_parse_lite_tests: OK\n";
    return 0;
  }

  std::cerr << "cli_parse_lite_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
