#include "cli/CliParse.hpp"

#include "wangpaint/Brush.hpp"
#include "wangpaint/ConfigIO.hpp"
#include "wangpaint/GridDiff.hpp"
#include "wangpaint/Hash.hpp"
#include "wangpaint/LogTee.hpp"
#include "wangpaint/PaintTarget.hpp"
#include "wangpaint/TerrainPaint.hpp"
#include "wangpaint/TerrainSetIO.hpp"
#include "wangpaint/Version.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace wangpaint;

struct PaintOp {
  enum class Kind : std::uint8_t {
    Target, // explicit corner/edge
    World,  // world position resolved with the tile size
    Stroke, // corner-lattice line
  };

  Kind kind = Kind::Target;
  PaintTarget target;
  float worldX = 0.0f;
  float worldY = 0.0f;
  Point from;
  Point to;

  // -1: use the config terrain.
  int terrain = -1;
  std::string label;
};

struct Options {
  std::string terrainSetPath;
  std::string gridPath;
  int newW = 0;
  int newH = 0;

  std::string configPath;
  std::optional<float> tileSize;
  std::optional<bool> trace;

  std::vector<PaintOp> ops;
  bool preview = false;

  std::string outPath;
  std::string logPath;
  bool quiet = false;
};

static void PrintHelp()
{
  std::cout
      << "wangpaint_cli (headless terrain painter)\n\n"
      << "Usage:\n"
      << "  wangpaint_cli --terrain-set <set.json> (--grid <grid.json> | --size <WxH>) [ops...] [options]\n\n"
      << "Paint operations (applied in order):\n"
      << "  --corner <x,y>               Paint the corner at (x,y).\n"
      << "  --hedge <x,y>                Paint the horizontal edge below cell (x,y).\n"
      << "  --vedge <x,y>                Paint the vertical edge left of cell (x,y).\n"
      << "  --at <wx,wy>                 Paint whatever the world position resolves to.\n"
      << "  --stroke <x0,y0:x1,y1>       Drag the brush across the corner lattice.\n\n"
      << "Options:\n"
      << "  --terrain <N>                Terrain index for the following operations.\n"
      << "  --tile-size <F>              World units per tile for --at. Default: 1\n"
      << "  --config <paint.json>        Paint config (tile_size, terrain, trace).\n"
      << "  --preview                    Report the tiles each operation would change; grid is left unchanged.\n"
      << "  --out <grid.json>            Write the resulting grid.\n"
      << "  --trace                      Print filler trace lines to stderr.\n"
      << "  --log <file>                 Copy stdout/stderr into a log file (rotated).\n"
      << "  --quiet                      Suppress the stdout summary (errors still print).\n"
      << "  --version                    Print the version and exit.\n"
      << "  -h, --help                   Show this help.\n";
}

static void PrintPreview(const std::string& label, const std::vector<PreviewTile>& tiles)
{
  std::cout << "preview " << label << ": " << tiles.size() << " tile(s)\n";
  for (const PreviewTile& t : tiles) {
    std::cout << "  (" << t.cell.x << "," << t.cell.y << ") -> " << t.tile << "\n";
  }
}

static void PrintFillStats(const std::string& label, int terrain, const FillStats& s)
{
  std::cout << "paint " << label << " terrain=" << terrain << " placed=" << s.placed << " unmatched=" << s.unmatched
            << " corrections=" << s.correctionsApplied << "/" << s.correctionsQueued << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  using namespace wangpaint;

  Options opt;
  int currentTerrain = -1;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();

    auto requireValue = [&](const char* what) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires " << what << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }
    if (arg == "--version") {
      std::cout << "wangpaint_cli " << WangPaintFullVersionString() << "\n";
      return 0;
    }
    if (arg == "--terrain-set") {
      const char* v = requireValue("a path");
      if (!v) return 2;
      opt.terrainSetPath = v;
      continue;
    }
    if (arg == "--grid") {
      const char* v = requireValue("a path");
      if (!v) return 2;
      opt.gridPath = v;
      continue;
    }
    if (arg == "--size") {
      const char* v = requireValue("WxH");
      if (!v) return 2;
      if (!cli::ParseWxH(v, &opt.newW, &opt.newH)) {
        std::cerr << "invalid --size (expected WxH)\n";
        return 2;
      }
      continue;
    }
    if (arg == "--config") {
      const char* v = requireValue("a path");
      if (!v) return 2;
      opt.configPath = v;
      continue;
    }
    if (arg == "--terrain") {
      const char* v = requireValue("an index");
      if (!v) return 2;
      int t = 0;
      if (!cli::ParseI32(v, &t) || t < 0) {
        std::cerr << "invalid --terrain\n";
        return 2;
      }
      currentTerrain = t;
      continue;
    }
    if (arg == "--tile-size") {
      const char* v = requireValue("a value");
      if (!v) return 2;
      float s = 0.0f;
      if (!cli::ParseF32(v, &s) || !(s > 0.0f)) {
        std::cerr << "invalid --tile-size\n";
        return 2;
      }
      opt.tileSize = s;
      continue;
    }
    if (arg == "--corner" || arg == "--hedge" || arg == "--vedge") {
      const char* v = requireValue("x,y");
      if (!v) return 2;
      std::uint32_t x = 0;
      std::uint32_t y = 0;
      if (!cli::ParseU32Pair(v, &x, &y)) {
        std::cerr << "invalid " << arg << " (expected x,y)\n";
        return 2;
      }
      PaintOp op;
      op.kind = PaintOp::Kind::Target;
      if (arg == "--corner") op.target = PaintTarget::Corner(x, y);
      else if (arg == "--hedge") op.target = PaintTarget::HorizontalEdge(x, y);
      else op.target = PaintTarget::VerticalEdge(x, y);
      op.terrain = currentTerrain;
      op.label = ToString(op.target);
      opt.ops.push_back(op);
      continue;
    }
    if (arg == "--at") {
      const char* v = requireValue("wx,wy");
      if (!v) return 2;
      PaintOp op;
      op.kind = PaintOp::Kind::World;
      if (!cli::ParseF32Pair(v, &op.worldX, &op.worldY)) {
        std::cerr << "invalid --at (expected wx,wy)\n";
        return 2;
      }
      op.terrain = currentTerrain;
      opt.ops.push_back(op);
      continue;
    }
    if (arg == "--stroke") {
      const char* v = requireValue("x0,y0:x1,y1");
      if (!v) return 2;
      PaintOp op;
      op.kind = PaintOp::Kind::Stroke;
      if (!cli::ParseI32Segment(v, &op.from.x, &op.from.y, &op.to.x, &op.to.y)) {
        std::cerr << "invalid --stroke (expected x0,y0:x1,y1)\n";
        return 2;
      }
      op.terrain = currentTerrain;
      op.label = std::string("stroke(") + v + ")";
      opt.ops.push_back(op);
      continue;
    }
    if (arg == "--preview") {
      opt.preview = true;
      continue;
    }
    if (arg == "--out") {
      const char* v = requireValue("a path");
      if (!v) return 2;
      opt.outPath = v;
      continue;
    }
    if (arg == "--trace") {
      opt.trace = true;
      continue;
    }
    if (arg == "--log") {
      const char* v = requireValue("a path");
      if (!v) return 2;
      opt.logPath = v;
      continue;
    }
    if (arg == "--quiet") {
      opt.quiet = true;
      continue;
    }

    std::cerr << "unknown argument: " << arg << "\n";
    return 2;
  }

  if (opt.terrainSetPath.empty()) {
    PrintHelp();
    return 2;
  }
  if (opt.gridPath.empty() == (opt.newW <= 0)) {
    std::cerr << "exactly one of --grid or --size is required\n";
    return 2;
  }

  LogTee logTee;
  if (!opt.logPath.empty()) {
    LogTeeOptions lo;
    lo.path = opt.logPath;
    std::string err;
    if (!logTee.start(lo, err)) {
      std::cerr << "failed to start log: " << err << "\n";
      return 1;
    }
  }

  std::string err;

  PaintConfig cfg;
  if (!opt.configPath.empty() && !LoadPaintConfigJsonFile(opt.configPath, cfg, err)) {
    std::cerr << "failed to load config: " << err << "\n";
    return 1;
  }
  if (opt.tileSize) cfg.tileSize = *opt.tileSize;
  if (opt.trace) cfg.trace = *opt.trace;

  TerrainSet set;
  if (!LoadTerrainSetJsonFile(opt.terrainSetPath, set, err)) {
    std::cerr << "failed to load terrain set: " << err << "\n";
    return 1;
  }

  TileGrid grid;
  if (!opt.gridPath.empty()) {
    if (!LoadTileGridJsonFile(opt.gridPath, grid, err)) {
      std::cerr << "failed to load grid: " << err << "\n";
      return 1;
    }
  } else {
    grid = TileGrid(opt.newW, opt.newH);
  }

  if (!opt.quiet) {
    std::cout << "set: " << (set.name().empty() ? "(unnamed)" : set.name()) << " (" << ToString(set.type()) << ", "
              << set.terrainCount() << " terrains, " << set.tileTerrains().size() << " tiles)\n";
    std::cout << "grid: " << grid.width() << "x" << grid.height() << " filled=" << grid.countFilled() << "\n";
  }

  PaintOptions paintOpt;
  if (cfg.trace) {
    paintOpt.trace = [](const std::string& line) { std::cerr << "[trace] " << line << "\n"; };
  }

  const TileGrid before = grid;

  for (PaintOp& op : opt.ops) {
    const int terrain = (op.terrain >= 0) ? op.terrain : cfg.terrain;
    if (terrain >= set.terrainCount()) {
      std::cerr << "warning: terrain " << terrain << " is not defined by the set (" << set.terrainCount()
                << " terrains)\n";
    }

    std::vector<PaintTarget> targets;
    if (op.kind == PaintOp::Kind::World) {
      op.target = ResolvePaintTarget(op.worldX, op.worldY, cfg.tileSize, set.type());
      op.label = ToString(op.target);
      targets.push_back(op.target);
    } else if (op.kind == PaintOp::Kind::Stroke) {
      targets = StrokeTargets(op.from, op.to, set.type());
    } else {
      targets.push_back(op.target);
    }

    if (opt.preview) {
      const std::vector<PreviewTile> tiles = PreviewTerrainAtTargets(grid, targets, set, terrain, paintOpt);
      if (!opt.quiet) PrintPreview(op.label, tiles);
      continue;
    }

    FillStats total;
    for (const PaintTarget& t : targets) {
      const FillStats s = PaintTerrainAtTarget(grid, t, set, terrain, paintOpt);
      total.regionCells += s.regionCells;
      total.placed += s.placed;
      total.unmatched += s.unmatched;
      total.correctionsQueued += s.correctionsQueued;
      total.correctionsApplied += s.correctionsApplied;
    }
    if (!opt.quiet) PrintFillStats(op.label, terrain, total);
  }

  if (!opt.quiet) {
    const GridDiffStats d = DiffTileGrids(before, grid);
    std::cout << "hash: " << cli::HexU64(HashTileGrid(grid)) << "\n";
    std::cout << "changed: " << d.cellsDifferent << " (filled " << d.filled << ", retiled " << d.retiled << ")\n";
  }

  if (!opt.outPath.empty()) {
    if (!cli::EnsureParentDir(opt.outPath)) {
      std::cerr << "failed to create output directory for: " << opt.outPath << "\n";
      return 1;
    }
    if (!WriteTileGridJsonFile(opt.outPath, grid, err)) {
      std::cerr << "failed to write grid: " << err << "\n";
      return 1;
    }
  }

  return 0;
}
