// D7.1 - End-to-end: scene -> document -> optimize -> compliance

#include "vb/scene/Scene.hpp"
#include "vb/recipe/ShapeRecipes.hpp"
#include "vb/recipe/GradientRecipes.hpp"
#include "vb/optimize/SizeOptimizer.hpp"
#include "vb/compliance/ComplianceSanitizer.hpp"
#include "vb/errors/Errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static std::string fixed4(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f", v);
  return buf;
}

int main() {
  // ---- Test 1: two layers, paint order, validation ----
  {
    vb::Scene scene(800, 600, 10.0);
    scene.createLayer("background", 0);
    scene.createLayer("foreground", 10);
    requireTrue(scene.addToLayer("foreground", vb::makeCircle(400, 300, 50, {{"fill", "#ff0000"}})),
                "circle added");
    requireTrue(scene.addToLayer("background", vb::makeRect(0, 0, 800, 600, {{"fill", "#ffffff"}})),
                "rect added");

    const std::string svg = scene.generateSvg();
    requireTrue(svg.find("<rect") < svg.find("<circle"), "rect painted before circle");
    requireTrue(scene.validate(), "scene validates");
    std::printf("  Test 1 (layers): PASS\n");
  }

  // ---- Test 2: 5000 circles against a 10 KB budget ----
  {
    vb::Scene scene(800, 600, 10.0);
    scene.createLayer("dots");
    for (int i = 0; i < 5000; ++i) {
      vb::Element c("circle", {{"cx", fixed4((i % 100) * 7.12345)},
                               {"cy", fixed4((i / 100) * 11.98765)},
                               {"r", "2.5000"},
                               {"fill", "#3a7bd5"},
                               {"opacity", "1"}});
      requireTrue(scene.addToLayer("dots", std::move(c)), "circle added");
    }
    requireTrue(scene.elementCount() == 5000, "element count");

    const std::string svg = scene.generateSvg();
    auto out = vb::optimize(svg, 10.0);
    const std::vector<std::string> expected = {"whitespace", "default-elision", "precision-reduction"};
    requireTrue(out.appliedSteps == expected, "whitespace, default-elision, precision-reduction");
    requireTrue(!out.metBudget, "5000 circles cannot fit 10 KB");
    requireTrue(out.sizeKb > 10.0, "reported size is over budget");
    requireTrue(out.sizeKb == static_cast<double>(out.sizeBytes) / 1024.0, "size in KB");
    requireTrue(out.sizeBytes < out.originalBytes, "smallest achieved size reported");
    requireTrue(out.finalPrecision == 0, "precision exhausted");
    requireTrue(out.document.find("opacity") == std::string::npos, "defaults elided");
    requireTrue(!scene.validate(), "over budget fails validation");

    auto again = vb::optimize(out.document, 10.0);
    requireTrue(again.document == out.document, "second pass changes nothing");
    std::printf("  Test 2 (5000 circles): PASS\n");
  }

  // ---- Test 3: script element removed with its descendants ----
  {
    vb::Scene scene(400, 300);
    scene.createLayer("main");
    scene.addToLayer("main", vb::makeRect(10, 10, 50, 50, {{"id", "keep"}}));
    scene.addToLayer("main", "script", {{"type", "text/javascript"}},
                     {vb::Element("g", {}, {vb::makeRect(0, 0, 1, 1, {{"id", "inner"}})})});
    requireTrue(!scene.validate(), "script fails validation");

    const std::string clean = vb::ensureCompliance(scene.generateSvg(), 10.0);
    requireTrue(clean.find("script") == std::string::npos, "script removed");
    requireTrue(clean.find("inner") == std::string::npos, "descendants removed");
    requireTrue(clean.find("id=\"keep\"") != std::string::npos, "other content kept");
    requireTrue(vb::ComplianceSanitizer().audit(clean).empty(), "result is clean");
    std::printf("  Test 3 (script removal): PASS\n");
  }

  // ---- Test 4: duplicate layer ----
  {
    vb::Scene scene(100, 100);
    scene.createLayer("bg", 0);
    bool threw = false;
    try {
      scene.createLayer("bg", 0);
    } catch (const vb::DuplicateLayerError& e) {
      threw = e.layer() == "bg";
    }
    requireTrue(threw, "DuplicateLayerError on second bg");
    std::printf("  Test 4 (duplicate layer): PASS\n");
  }

  // ---- Test 5: referenced gradients survive, unreferenced ones go ----
  {
    vb::Scene scene(300, 100);
    scene.createLayer("bar");
    scene.registerDef(vb::rainbowGradient("rb"));
    scene.registerDef(vb::metallicGradient("steel"));
    scene.addToLayer("bar", vb::makeRect(0.12345, 0, 300, 100, {{"fill", vb::gradientRef("rb")}}));

    vb::ComplianceSanitizer sanitizer;
    auto out = sanitizer.ensureComplianceOutcome(scene.generateSvg(), 0.1);
    requireTrue(!out.metBudget, "budget unreachable");
    requireTrue(out.document.find("id=\"rb\"") != std::string::npos, "referenced gradient kept");
    requireTrue(out.document.find("16.67%") != std::string::npos, "stop offsets not rounded");
    requireTrue(out.document.find("steel") == std::string::npos, "unreferenced gradient pruned");
    requireTrue(out.document.find("x=\"0\"") != std::string::npos, "geometry rounded");
    std::printf("  Test 5 (gradients): PASS\n");
  }

  std::printf("\nD7.1 scenarios PASS\n");
  return 0;
}
