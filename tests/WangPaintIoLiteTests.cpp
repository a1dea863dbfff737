#include "cli/CliParse.hpp"

#include "wangpaint/ConfigIO.hpp"
#include "wangpaint/Hash.hpp"
#include "wangpaint/Json.hpp"
#include "wangpaint/LogTee.hpp"
#include "wangpaint/TerrainSetIO.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (std::fabs(static_cast<double>(_a) - static_cast<double>(_b)) > static_cast<double>(eps)) {                  \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << "\n";            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
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

static bool StartsWith(const std::string& s, const std::string& prefix)
{
  return s.rfind(prefix, 0) == 0;
}

static bool Contains(const std::string& s, const std::string& needle)
{
  return s.find(needle) != std::string::npos;
}

static const char* kCoastSet = R"({
  "name": "coast",
  "type": "edges",
  "default_penalty": 2.5,
  "terrains": [
    {"name": "water", "color": [20, 60, 200]},
    {"name": "sand"}
  ],
  "transitions": [
    {"from": 0, "to": 1, "penalty": 0.5}
  ],
  "tiles": [
    {"id": 4, "terrain": [0, 0, 0, 0]},
    {"id": 1, "terrain": [1, null, 1, 1], "probability": 0.25}
  ]
})";

static void TestJsonParse()
{
  using namespace wangpaint;

  JsonValue v;
  std::string err;
  EXPECT_TRUE(ParseJson(R"({"a": [1, 2.5, true, null], "b": "x\"y", "c": {}})", v, err));
  EXPECT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a != nullptr && a->isArray());
  EXPECT_EQ(a->arrayValue.size(), static_cast<std::size_t>(4));
  EXPECT_NEAR(a->arrayValue[1].numberValue, 2.5, 1e-12);
  EXPECT_TRUE(a->arrayValue[2].isBool() && a->arrayValue[2].boolValue);
  EXPECT_TRUE(a->arrayValue[3].isNull());
  const JsonValue* b = FindJsonMember(v, "b");
  ASSERT_TRUE(b != nullptr);
  EXPECT_EQ(b->stringValue, std::string("x\"y"));
  EXPECT_TRUE(FindJsonMember(v, "missing") == nullptr);

  // \u escapes decode to UTF-8, including surrogate pairs.
  EXPECT_TRUE(ParseJson(R"("\u00e9\ud83d\ude00")", v, err));
  EXPECT_EQ(v.stringValue, std::string("\xC3\xA9\xF0\x9F\x98\x80"));

  // Errors carry the position.
  EXPECT_FALSE(ParseJson("{\n  \"a\": ]\n}", v, err));
  EXPECT_TRUE(StartsWith(err, "JSON parse error at line 2"));
  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_FALSE(ParseJson("{\"a\": 1} x", v, err));
  EXPECT_TRUE(Contains(err, "trailing characters"));
  EXPECT_FALSE(ParseJson("", v, err));

  // Nesting is bounded.
  std::string deep(300, '[');
  deep += std::string(300, ']');
  EXPECT_FALSE(ParseJson(deep, v, err));
  EXPECT_TRUE(Contains(err, "nesting too deep"));
}

static void TestJsonStringify()
{
  using namespace wangpaint;

  JsonValue root = JsonValue::MakeObject();
  root.add("w", JsonValue::MakeNumber(3));
  JsonValue arr = JsonValue::MakeArray();
  arr.push(JsonValue::MakeNumber(1));
  arr.push(JsonValue::MakeNull());
  arr.push(JsonValue::MakeNumber(0.5));
  root.add("t", std::move(arr));
  root.add("s", JsonValue::MakeString("a\nb"));

  JsonWriteOptions compact;
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(root, compact), std::string(R"({"w":3,"t":[1,null,0.5],"s":"a\nb"})"));

  const std::string pretty = JsonStringify(root);
  EXPECT_EQ(pretty, std::string("{\n  \"w\": 3,\n  \"t\": [1, null, 0.5],\n  \"s\": \"a\\nb\"\n}\n"));

  EXPECT_EQ(JsonEscape(std::string("\x01")), std::string("\\u0001"));
}

static void TestTerrainSetLoad()
{
  using namespace wangpaint;

  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(kCoastSet, root, err));

  TerrainSet set;
  ASSERT_TRUE(ParseTerrainSetJson(root, set, err));
  EXPECT_EQ(set.name(), std::string("coast"));
  EXPECT_EQ(set.type(), TerrainSetType::Edge);
  EXPECT_EQ(set.terrainCount(), 2);
  EXPECT_EQ(set.terrains()[0].b, static_cast<std::uint8_t>(200));
  EXPECT_EQ(set.terrains()[1].r, static_cast<std::uint8_t>(255));
  EXPECT_NEAR(set.defaultPenalty(), 2.5f, 1e-6f);
  EXPECT_NEAR(set.transitionPenalty(0, 1), 0.5f, 1e-6f);
  EXPECT_NEAR(set.transitionPenalty(1, 0), 2.5f, 1e-6f);
  EXPECT_NEAR(set.tileProbability(1), 0.25f, 1e-6f);
  EXPECT_NEAR(set.tileProbability(4), 1.0f, 1e-6f);

  WangId w;
  ASSERT_TRUE(set.tileWangId(1, w));
  EXPECT_EQ(w.colorAt(WangPosition::Top), static_cast<TerrainId>(2));
  EXPECT_EQ(w.colorAt(WangPosition::Right), static_cast<TerrainId>(0));
  EXPECT_EQ(w.colorAt(WangPosition::Left), static_cast<TerrainId>(2));

  // Tiles come back in ascending id order.
  ASSERT_TRUE(set.tileTerrains().size() == 2);
  EXPECT_EQ(set.tileTerrains().begin()->first, static_cast<TileId>(1));

  // Write -> load keeps everything the filler looks at.
  const std::string text = TerrainSetToJson(set);
  JsonValue again;
  ASSERT_TRUE(ParseJson(text, again, err));
  TerrainSet set2;
  ASSERT_TRUE(ParseTerrainSetJson(again, set2, err));
  EXPECT_EQ(HashTerrainSet(set), HashTerrainSet(set2));
  EXPECT_EQ(set2.name(), set.name());
}

static void ExpectSetError(const std::string& json, const std::string& needle)
{
  using namespace wangpaint;

  JsonValue root;
  std::string err;
  if (!ParseJson(json, root, err)) {
    ++g_failures;
    std::cerr << "bad test JSON: " << err << "\n";
    return;
  }

  TerrainSet set("keep", TerrainSetType::Mixed);
  const bool ok = ParseTerrainSetJson(root, set, err);
  EXPECT_FALSE(ok);
  if (!Contains(err, needle)) {
    ++g_failures;
    std::cerr << "expected error containing '" << needle << "', got '" << err << "'\n";
  }
  // A failed load never touches the output set.
  EXPECT_EQ(set.name(), std::string("keep"));
}

static void TestTerrainSetValidation()
{
  ExpectSetError(R"([])", "must be an object");
  ExpectSetError(R"({})", "'type'");
  ExpectSetError(R"({"type": "hex"})", "unknown type");
  ExpectSetError(R"({"type": "corner", "default_penalty": -1})", "default_penalty");
  ExpectSetError(R"({"type": "corner", "terrains": [{"color": [1, 2]}]})", "color");
  ExpectSetError(R"({"type": "corner", "terrains": [{"color": [1, 2, 300]}]})", "[0,255]");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "transitions": [{"from": 0, "to": 1, "penalty": 1}]})",
                 "unknown terrain");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "transitions": [{"from": 0, "to": 0, "penalty": -2}]})",
                 "non-negative");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "tiles": [{"id": 1, "terrain": [0, 0, 0]}]})",
                 "4 entries");
  ExpectSetError(R"({"type": "mixed", "terrains": [{}], "tiles": [{"id": 1, "terrain": [0, 0, 0, 0]}]})",
                 "8 entries");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "tiles": [{"id": 1, "terrain": [0, 0, 0, 1]}]})",
                 "terrain[3]");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "tiles": [{"id": -1, "terrain": [0, 0, 0, 0]}]})",
                 ".id");
  ExpectSetError(R"({"type": "corner", "terrains": [{}], "tiles": [{"id": 2, "terrain": [0, 0, 0, 0]},
                                                                 {"id": 2, "terrain": [0, 0, 0, 0]}]})",
                 "duplicate tile id 2");
  ExpectSetError(R"({"type": "corner", "terrains": [{}],
                     "tiles": [{"id": 2, "terrain": [0, 0, 0, 0], "probability": 0}]})",
                 "probability");

  // Too many terrains.
  std::string many = R"({"type": "corner", "terrains": [)";
  for (int i = 0; i < 255; ++i) many += (i ? ",{}" : "{}");
  many += "]}";
  ExpectSetError(many, "max 254");
}

static void TestTileGridJson()
{
  using namespace wangpaint;

  TileGrid grid(3, 2);
  grid.set(0, 0, 7);
  grid.set(2, 1, 0);

  const std::string text = TileGridToJson(grid);
  EXPECT_TRUE(Contains(text, "\"tiles\": [7, null, null, null, null, 0]"));

  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));
  TileGrid back;
  ASSERT_TRUE(ParseTileGridJson(root, back, err));
  EXPECT_TRUE(back == grid);

  // Tiles are optional: the grid starts empty.
  ASSERT_TRUE(ParseJson(R"({"width": 4, "height": 4})", root, err));
  ASSERT_TRUE(ParseTileGridJson(root, back, err));
  EXPECT_EQ(back.width(), 4);
  EXPECT_EQ(back.countFilled(), 0);

  ASSERT_TRUE(ParseJson(R"({"width": 2, "height": 2, "tiles": [1, 2, 3]})", root, err));
  EXPECT_FALSE(ParseTileGridJson(root, back, err));
  EXPECT_TRUE(Contains(err, "expected 4"));

  ASSERT_TRUE(ParseJson(R"({"width": 1, "height": 1, "tiles": [1.5]})", root, err));
  EXPECT_FALSE(ParseTileGridJson(root, back, err));

  ASSERT_TRUE(ParseJson(R"({"width": -1, "height": 1})", root, err));
  EXPECT_FALSE(ParseTileGridJson(root, back, err));
  EXPECT_TRUE(StartsWith(err, "width"));

  ASSERT_TRUE(ParseJson(R"({"width": 40000, "height": 1})", root, err));
  EXPECT_FALSE(ParseTileGridJson(root, back, err));
}

static void TestFileRoundtrip()
{
  using namespace wangpaint;

  const fs::path dir = MakeTempPath("wangpaint_io");
  std::error_code ec;
  fs::create_directories(dir, ec);
  ASSERT_TRUE(!ec);

  std::string err;

  const fs::path setPath = dir / "set.json";
  {
    std::ofstream f(setPath, std::ios::binary);
    f << kCoastSet;
  }
  TerrainSet set;
  EXPECT_TRUE(LoadTerrainSetJsonFile(setPath.string(), set, err));
  EXPECT_EQ(set.terrainCount(), 2);

  TileGrid grid(2, 2);
  grid.fill(4);
  const fs::path gridPath = dir / "grid.json";
  EXPECT_TRUE(WriteTileGridJsonFile(gridPath.string(), grid, err));
  TileGrid back;
  EXPECT_TRUE(LoadTileGridJsonFile(gridPath.string(), back, err));
  EXPECT_EQ(HashTileGrid(back), HashTileGrid(grid));

  // Loader errors name the file.
  const fs::path badPath = dir / "bad.json";
  {
    std::ofstream f(badPath, std::ios::binary);
    f << R"({"type": "corner", "tiles": 3})";
  }
  EXPECT_FALSE(LoadTerrainSetJsonFile(badPath.string(), set, err));
  EXPECT_TRUE(StartsWith(err, badPath.string() + ": "));
  EXPECT_EQ(set.terrainCount(), 2);

  EXPECT_FALSE(LoadTerrainSetJsonFile((dir / "missing.json").string(), set, err));
  EXPECT_FALSE(err.empty());

  fs::remove_all(dir, ec);
}

static void TestPaintConfig()
{
  using namespace wangpaint;

  PaintConfig cfg;
  JsonValue root;
  std::string err;

  // Missing keys keep their values.
  ASSERT_TRUE(ParseJson(R"({"terrain": 2})", root, err));
  EXPECT_TRUE(ApplyPaintConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.terrain, 2);
  EXPECT_NEAR(cfg.tileSize, 1.0f, 1e-6f);
  EXPECT_FALSE(cfg.trace);

  ASSERT_TRUE(ParseJson(R"({"tile_size": 32, "trace": true})", root, err));
  EXPECT_TRUE(ApplyPaintConfigJson(root, cfg, err));
  EXPECT_NEAR(cfg.tileSize, 32.0f, 1e-6f);
  EXPECT_TRUE(cfg.trace);
  EXPECT_EQ(cfg.terrain, 2);

  // Invalid values are rejected without partial updates.
  ASSERT_TRUE(ParseJson(R"({"terrain": 5, "tile_size": 0})", root, err));
  EXPECT_FALSE(ApplyPaintConfigJson(root, cfg, err));
  EXPECT_TRUE(Contains(err, "tile_size"));
  EXPECT_EQ(cfg.terrain, 2);

  ASSERT_TRUE(ParseJson(R"({"terrain": -1})", root, err));
  EXPECT_FALSE(ApplyPaintConfigJson(root, cfg, err));

  ASSERT_TRUE(ParseJson(R"({"trace": 1})", root, err));
  EXPECT_FALSE(ApplyPaintConfigJson(root, cfg, err));
  EXPECT_TRUE(Contains(err, "boolean"));

  // Writer output loads back.
  const std::string text = PaintConfigToJson(cfg);
  ASSERT_TRUE(ParseJson(text, root, err));
  PaintConfig again;
  EXPECT_TRUE(ApplyPaintConfigJson(root, again, err));
  EXPECT_NEAR(again.tileSize, cfg.tileSize, 1e-6f);
  EXPECT_EQ(again.terrain, cfg.terrain);
  EXPECT_EQ(again.trace, cfg.trace);
}

static void TestCliParse()
{
  using namespace wangpaint::cli;

  int w = 0;
  int h = 0;
  EXPECT_TRUE(ParseWxH("64x32", &w, &h));
  EXPECT_EQ(w, 64);
  EXPECT_EQ(h, 32);
  EXPECT_FALSE(ParseWxH("0x4", &w, &h));
  EXPECT_FALSE(ParseWxH("64", &w, &h));
  EXPECT_EQ(w, 64);

  std::uint32_t x = 0;
  std::uint32_t y = 0;
  EXPECT_TRUE(ParseU32Pair("3,4", &x, &y));
  EXPECT_EQ(x, 3u);
  EXPECT_EQ(y, 4u);
  EXPECT_FALSE(ParseU32Pair("-1,4", &x, &y));
  EXPECT_FALSE(ParseU32Pair("3;4", &x, &y));

  float fx = 0.0f;
  float fy = 0.0f;
  EXPECT_TRUE(ParseF32Pair("1.5,-2", &fx, &fy));
  EXPECT_NEAR(fx, 1.5f, 1e-6f);
  EXPECT_NEAR(fy, -2.0f, 1e-6f);
  EXPECT_FALSE(ParseF32Pair("nan,1", &fx, &fy));
  EXPECT_FALSE(ParseF32Pair("1e40,1", &fx, &fy));

  int x0 = 0;
  int y0 = 0;
  int x1 = 0;
  int y1 = 0;
  EXPECT_TRUE(ParseI32Segment("0,-1:5,2", &x0, &y0, &x1, &y1));
  EXPECT_EQ(y0, -1);
  EXPECT_EQ(x1, 5);
  EXPECT_FALSE(ParseI32Segment("0,0-5,2", &x0, &y0, &x1, &y1));
  EXPECT_FALSE(ParseI32Segment("0,0:5", &x0, &y0, &x1, &y1));

  int i = 0;
  EXPECT_TRUE(ParseI32("+7", &i));
  EXPECT_EQ(i, 7);
  EXPECT_FALSE(ParseI32("7 ", &i));

  EXPECT_EQ(HexU64(0xABCull), std::string("0x0000000000000abc"));
}

static void TestLogTee()
{
  using namespace wangpaint;

  const fs::path dir = MakeTempPath("wangpaint_log");
  const fs::path logPath = dir / "run.log";
  std::error_code ec;

  // Keep the console quiet while the tee is installed.
  std::ostringstream sink;
  std::streambuf* orig = std::cout.rdbuf(sink.rdbuf());

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = logPath;
    opt.teeStderr = false;
    std::string err;
    EXPECT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cout << "first line\nsecond";
    std::cout << " line\n";
    tee.stop();
    EXPECT_FALSE(tee.active());
  }

  std::cout.rdbuf(orig);

  EXPECT_EQ(sink.str(), std::string("first line\nsecond line\n"));

  std::string text;
  std::string err;
  EXPECT_TRUE(ReadFileText(logPath.string(), text, err));
  EXPECT_TRUE(Contains(text, "[OUT] first line\n"));
  EXPECT_TRUE(Contains(text, "[OUT] second line\n"));

  // Starting again rotates the previous log.
  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = logPath;
    opt.teeStdout = false;
    opt.teeStderr = false;
    EXPECT_TRUE(tee.start(opt, err));
  }
  fs::path rotated = logPath;
  rotated += ".1";
  EXPECT_TRUE(fs::exists(rotated, ec));

  LogTee bad;
  EXPECT_FALSE(bad.start(LogTeeOptions{}, err));
  EXPECT_TRUE(Contains(err, "empty"));

  fs::remove_all(dir, ec);
}

int main()
{
  TestJsonParse();
  TestJsonStringify();
  TestTerrainSetLoad();
  TestTerrainSetValidation();
  TestTileGridJson();
  TestFileRoundtrip();
  TestPaintConfig();
  TestCliParse();
  TestLogTee();

  if (g_failures == 0) {
    std::cout << "wangpaint_io_tests: OK\n";
    return 0;
  }

  std::cerr << "wangpaint_io_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
