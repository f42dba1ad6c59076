// D2.1 - Document serializer: root, defs-first, z ordering, escaping, determinism

#include "vb/scene/Scene.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/svg/XmlParser.hpp"
#include "vb/recipe/GradientRecipes.hpp"
#include "vb/recipe/ShapeRecipes.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: exact pretty output for a one-layer scene ----
  {
    vb::Scene scene(100, 50);
    scene.createLayer("bg", 0);
    scene.addToLayer("bg", vb::makeRect(0, 0, 100, 50, {{"fill", "#fff"}}));

    const std::string expected =
      "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100\" height=\"50\" viewBox=\"0 0 100 50\">\n"
      "  <g id=\"bg\">\n"
      "    <rect x=\"0\" y=\"0\" width=\"100\" height=\"50\" fill=\"#fff\"/>\n"
      "  </g>\n"
      "</svg>";
    requireTrue(scene.generateSvg() == expected, "pretty output matches");
    std::printf("  Test 1 (exact output): PASS\n");
  }

  // ---- Test 2: defs first, layers by z then creation ----
  {
    vb::Scene scene(200, 200);
    scene.createLayer("late", 0);
    scene.createLayer("front", 10);
    scene.createLayer("early", 0);
    scene.createLayer("empty", -1);
    scene.addToLayer("front", vb::makeCircle(1, 1, 1, {{"id", "c-front"}}));
    scene.addToLayer("early", vb::makeCircle(2, 2, 1, {{"id", "c-early"}}));
    scene.addToLayer("late", vb::makeCircle(3, 3, 1, {{"id", "c-late"}}));
    scene.registerDef(vb::rainbowGradient("rb"));

    const std::string svg = scene.generateSvg();
    const auto defs = svg.find("<defs>");
    const auto late = svg.find("c-late");
    const auto early = svg.find("c-early");
    const auto front = svg.find("c-front");
    requireTrue(defs != std::string::npos, "defs emitted");
    requireTrue(defs < svg.find("<g "), "defs precede layers");
    requireTrue(late < early, "equal z: created first renders first");
    requireTrue(early < front, "lower z renders first");
    requireTrue(svg.find("id=\"empty\"") == std::string::npos, "empty layer skipped");
    std::printf("  Test 2 (ordering): PASS\n");
  }

  // ---- Test 3: escaping ----
  {
    vb::Element e("text", {{"data", "a<b&\"c\""}}, {}, "x < y & z");
    vb::SerializeOptions compact;
    compact.pretty = false;
    const std::string out = vb::serializeElement(e, compact);
    requireTrue(out == "<text data=\"a&lt;b&amp;&quot;c&quot;\">x &lt; y &amp; z</text>",
                "attribute and text escaped");

    vb::ParseError err;
    auto back = vb::parseMarkup(out, err);
    requireTrue(back.has_value(), "escaped output parses");
    requireTrue(*back->attr("data") == "a<b&\"c\"", "attribute value round-trips");
    requireTrue(back->text() == "x < y & z", "text round-trips");
    std::printf("  Test 3 (escaping): PASS\n");
  }

  // ---- Test 4: deterministic and well formed ----
  {
    vb::Scene scene(640, 480);
    scene.createLayer("shapes", 1);
    scene.createLayer("labels", 2);
    scene.registerDef(vb::metallicGradient("steel"));
    scene.addToLayer("shapes", vb::makeRect(10, 10, 100, 40, {{"fill", vb::gradientRef("steel")}}));
    scene.addToLayer("shapes", vb::makeGroup({vb::makeLine(0, 0, 5, 5), vb::makeLine(5, 5, 9, 0)},
                                             {{"stroke", "#000"}}));
    scene.addToLayer("labels", vb::makeText(20, 30, "Score: 10 < 20"));

    const std::string a = scene.generateSvg();
    const std::string b = scene.generateSvg();
    requireTrue(a == b, "generateSvg is repeatable");

    vb::ParseError err;
    auto root = vb::parseMarkup(a, err);
    requireTrue(root.has_value(), "output is well formed");
    requireTrue(root->tag() == "svg", "root is svg");
    requireTrue(root->children().size() == 3, "defs + two layer groups");
    requireTrue(root->children()[0].tag() == "defs", "defs first child");

    vb::SerializeOptions compact;
    compact.pretty = false;
    const std::string c = vb::serializeScene(scene, compact);
    requireTrue(c.find('\n') == std::string::npos, "compact output has no newlines");
    requireTrue(vb::serializeElement(*root, compact) == c, "parse + compact equals compact");
    std::printf("  Test 4 (determinism): PASS\n");
  }

  // ---- Test 5: pretty output adds no whitespace inside text content ----
  {
    vb::Element label = vb::ElementBuilder("text")
                          .attr("x", "1")
                          .text("Hello ")
                          .child(vb::Element("tspan", {{"fill", "red"}}, {}, "big"))
                          .text(" world")
                          .build();
    vb::Element runs("text", {}, {vb::Element("tspan", {}, {}, "a"), vb::Element("tspan", {}, {}, "b")});
    vb::Element g("g", {}, {label, runs});

    const std::string pretty = vb::serializeElement(g);
    requireTrue(pretty ==
                "<g>\n"
                "  <text x=\"1\">Hello <tspan fill=\"red\">big</tspan> world</text>\n"
                "  <text><tspan>a</tspan><tspan>b</tspan></text>\n"
                "</g>", "text content written inline");

    auto back = vb::parseDocument(pretty);
    requireTrue(back == g, "pretty output parses back to the same tree");
    std::printf("  Test 5 (mixed content): PASS\n");
  }

  // ---- Test 6: xlink prefix declared on the root when used ----
  {
    vb::Scene scene(50, 50);
    scene.createLayer("refs");
    scene.registerDef(vb::makeCircle(0, 0, 1, {{"id", "dot"}}));
    requireTrue(scene.generateSvg().find("xmlns:xlink") == std::string::npos, "no prefix, no declaration");

    scene.addToLayer("refs", "use", {{"xlink:href", "#dot"}});
    const std::string svg = scene.generateSvg();
    requireTrue(svg.find("<svg xmlns=\"http://www.w3.org/2000/svg\" "
                         "xmlns:xlink=\"http://www.w3.org/1999/xlink\" width=\"50\"") == 0,
                "declaration follows xmlns");
    requireTrue(scene.validate(), "document with xlink references validates");
    std::printf("  Test 6 (xlink declaration): PASS\n");
  }

  std::printf("\nD2.1 serializer PASS\n");
  return 0;
}
