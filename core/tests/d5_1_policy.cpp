// D5.1 - Policy tables: JSON round-trip, overlay, rejection, effect on the pipeline

#include "vb/config/Policy.hpp"
#include "vb/compliance/ComplianceSanitizer.hpp"
#include "vb/optimize/Strategies.hpp"
#include "vb/svg/Serializer.hpp"
#include "vb/svg/XmlParser.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool samePolicy(const vb::Policy& a, const vb::Policy& b) {
  return a.optimizer.defaultValues == b.optimizer.defaultValues &&
         a.optimizer.inheritedAttributes == b.optimizer.inheritedAttributes &&
         a.optimizer.colorAttributes == b.optimizer.colorAttributes &&
         a.optimizer.precisionAttributes == b.optimizer.precisionAttributes &&
         a.optimizer.precisionExemptTags == b.optimizer.precisionExemptTags &&
         a.optimizer.startPrecision == b.optimizer.startPrecision &&
         a.optimizer.precisionStep == b.optimizer.precisionStep &&
         a.compliance.globalAttributes == b.compliance.globalAttributes &&
         a.compliance.tagAttributes == b.compliance.tagAttributes &&
         a.compliance.minCanvas == b.compliance.minCanvas &&
         a.compliance.maxCanvas == b.compliance.maxCanvas;
}

int main() {
  const vb::Policy defaults = vb::defaultPolicy();

  // ---- Test 1: built-in tables ----
  {
    requireTrue(defaults.optimizer.defaultValues.at("stroke-linecap") == "butt", "linecap default");
    requireTrue(defaults.optimizer.inheritedAttributes.count("fill-opacity") == 1, "inherited");
    requireTrue(defaults.optimizer.inheritedAttributes.count("opacity") == 0, "opacity not inherited");
    requireTrue(defaults.compliance.tagAttributes.count("script") == 0, "script not allowed");
    requireTrue(defaults.compliance.tagAttributes.count("radialGradient") == 1, "gradients allowed");
    requireTrue(defaults.compliance.minCanvas == 1 && defaults.compliance.maxCanvas == 8192, "canvas");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: JSON round-trip ----
  {
    const std::string json = vb::serializePolicy(defaults);
    vb::Policy loaded;
    requireTrue(vb::deserializePolicy(json, loaded), "parses");
    requireTrue(samePolicy(loaded, defaults), "identical after round-trip");
    requireTrue(vb::serializePolicy(loaded) == json, "stable JSON");
    std::printf("  Test 2 (round-trip): PASS\n");
  }

  // ---- Test 3: overlay keeps absent keys ----
  {
    vb::Policy p = defaults;
    requireTrue(vb::deserializePolicy(
      "{\"optimizer\":{\"startPrecision\":2},\"compliance\":{\"maxCanvas\":4096}}", p), "overlay parses");
    requireTrue(p.optimizer.startPrecision == 2, "startPrecision replaced");
    requireTrue(p.optimizer.precisionStep == 1, "precisionStep kept");
    requireTrue(p.optimizer.defaultValues == defaults.optimizer.defaultValues, "defaults kept");
    requireTrue(p.compliance.maxCanvas == 4096, "maxCanvas replaced");
    requireTrue(p.compliance.tagAttributes == defaults.compliance.tagAttributes, "tags kept");
    std::printf("  Test 3 (overlay): PASS\n");
  }

  // ---- Test 4: rejected input leaves the target untouched ----
  {
    vb::Policy p = defaults;
    requireTrue(!vb::deserializePolicy("not json", p), "parse error");
    requireTrue(!vb::deserializePolicy("[]", p), "not an object");
    requireTrue(!vb::deserializePolicy("{\"optimizer\":{\"startPrecision\":\"3\"}}", p), "string int");
    requireTrue(!vb::deserializePolicy("{\"optimizer\":{\"precisionStep\":0}}", p), "zero step");
    requireTrue(!vb::deserializePolicy("{\"optimizer\":{\"startPrecision\":-1}}", p), "negative start");
    requireTrue(!vb::deserializePolicy("{\"compliance\":{\"tags\":{\"rect\":\"x\"}}}", p), "tag list type");
    requireTrue(!vb::deserializePolicy(
      "{\"compliance\":{\"maxCanvas\":100,\"globalAttributes\":[1]}}", p), "non-string entry");
    requireTrue(samePolicy(p, defaults), "unchanged after failures");
    std::printf("  Test 4 (rejection): PASS\n");
  }

  // ---- Test 5: custom tables drive the pipeline ----
  {
    vb::Policy p = defaults;
    requireTrue(vb::deserializePolicy(
      "{\"compliance\":{\"globalAttributes\":[],"
      "\"tags\":{\"svg\":[\"width\",\"height\"],\"rect\":[\"width\",\"height\"]}}}", p),
      "custom allowlist");
    vb::ComplianceSanitizer strict(p);
    requireTrue(strict.sanitize(
      "<svg width=\"10\" height=\"10\"><rect width=\"1\" height=\"1\" fill=\"red\"/><circle r=\"1\"/></svg>") ==
      "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"10\" height=\"10\"><rect width=\"1\" height=\"1\"/></svg>",
      "custom allowlist applied");

    vb::Policy q = defaults;
    requireTrue(vb::deserializePolicy(
      "{\"optimizer\":{\"defaults\":{\"fill\":\"black\"},\"inherited\":[]}}", q), "custom defaults");
    vb::SerializeOptions compact;
    compact.pretty = false;
    const auto root = vb::parseDocument("<svg><rect fill=\"Black\" opacity=\"1\"/></svg>");
    requireTrue(vb::serializeElement(vb::elideDefaults(root, q.optimizer), compact) ==
                "<svg><rect opacity=\"1\"/></svg>", "custom defaults applied");
    std::printf("  Test 5 (custom tables): PASS\n");
  }

  std::printf("\nD5.1 policy PASS\n");
  return 0;
}
