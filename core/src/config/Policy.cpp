#include "vb/config/Policy.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace vb {

// -------------------- Built-in tables --------------------

OptimizerPolicy defaultOptimizerPolicy() {
  OptimizerPolicy p;
  p.defaultValues = {
    {"opacity", "1"},
    {"fill-opacity", "1"},
    {"stroke-opacity", "1"},
    {"stop-opacity", "1"},
    {"stroke-width", "1"},
    {"stroke-linecap", "butt"},
    {"stroke-linejoin", "miter"},
    {"stroke-miterlimit", "4"},
    {"stroke-dashoffset", "0"},
    {"fill-rule", "nonzero"},
    {"clip-rule", "nonzero"},
    {"visibility", "visible"},
  };
  p.inheritedAttributes = {
    "fill-opacity", "stroke-opacity", "stroke-width", "stroke-linecap",
    "stroke-linejoin", "stroke-miterlimit", "stroke-dashoffset",
    "fill-rule", "clip-rule", "visibility",
  };
  p.colorAttributes = {
    "fill", "stroke", "stop-color", "color", "flood-color", "lighting-color",
  };
  p.precisionAttributes = {
    "x", "y", "cx", "cy", "r", "rx", "ry", "x1", "y1", "x2", "y2",
    "width", "height", "d", "points", "transform", "stroke-width",
    "font-size", "dx", "dy",
  };
  p.precisionExemptTags = {"linearGradient", "radialGradient", "stop"};
  return p;
}

CompliancePolicy defaultCompliancePolicy() {
  CompliancePolicy p;
  p.globalAttributes = {
    "id", "class", "transform", "fill", "fill-opacity", "fill-rule",
    "stroke", "stroke-width", "stroke-opacity", "stroke-linecap",
    "stroke-linejoin", "stroke-miterlimit", "stroke-dasharray",
    "stroke-dashoffset", "opacity", "clip-path", "clip-rule", "mask",
    "visibility", "display", "color",
  };

  const std::set<std::string> text = {
    "x", "y", "dx", "dy", "rotate", "font-family", "font-size", "font-weight",
    "font-style", "text-anchor", "dominant-baseline", "letter-spacing",
  };
  const std::set<std::string> gradient = {
    "gradientUnits", "gradientTransform", "spreadMethod", "href", "xlink:href",
  };

  p.tagAttributes = {
    {"svg", {"xmlns", "xmlns:xlink", "width", "height", "viewBox",
             "preserveAspectRatio", "version"}},
    {"g", {}},
    {"defs", {}},
    {"title", {}},
    {"desc", {}},
    {"symbol", {"viewBox", "preserveAspectRatio"}},
    {"use", {"x", "y", "width", "height", "href", "xlink:href"}},
    {"rect", {"x", "y", "width", "height", "rx", "ry"}},
    {"circle", {"cx", "cy", "r"}},
    {"ellipse", {"cx", "cy", "rx", "ry"}},
    {"line", {"x1", "y1", "x2", "y2"}},
    {"polyline", {"points"}},
    {"polygon", {"points"}},
    {"path", {"d", "pathLength"}},
    {"text", text},
    {"tspan", text},
    {"stop", {"offset", "stop-color", "stop-opacity"}},
    {"clipPath", {"clipPathUnits"}},
    {"mask", {"x", "y", "width", "height", "maskUnits", "maskContentUnits"}},
    {"pattern", {"x", "y", "width", "height", "patternUnits",
                 "patternContentUnits", "patternTransform", "viewBox"}},
  };

  auto linear = gradient;
  linear.insert({"x1", "y1", "x2", "y2"});
  p.tagAttributes["linearGradient"] = linear;

  auto radial = gradient;
  radial.insert({"cx", "cy", "r", "fx", "fy", "fr"});
  p.tagAttributes["radialGradient"] = radial;
  return p;
}

Policy defaultPolicy() {
  Policy p;
  p.optimizer = defaultOptimizerPolicy();
  p.compliance = defaultCompliancePolicy();
  return p;
}

// -------------------- JSON --------------------

namespace {

rapidjson::Value stringArray(const std::set<std::string>& values,
                             rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (const auto& v : values) arr.PushBack(rapidjson::Value(v.c_str(), alloc), alloc);
  return arr;
}

// Replace `out` with the strings of `obj[key]` if present. False on bad type.
bool readStringSet(const rapidjson::Value& obj, const char* key, std::set<std::string>& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsArray()) return false;
  std::set<std::string> values;
  for (const auto& item : v.GetArray()) {
    if (!item.IsString()) return false;
    values.insert(item.GetString());
  }
  out = std::move(values);
  return true;
}

bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsInt()) return false;
  out = obj[key].GetInt();
  return true;
}

bool readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsNumber()) return false;
  out = obj[key].GetDouble();
  return true;
}

bool readOptimizer(const rapidjson::Value& obj, OptimizerPolicy& out) {
  if (obj.HasMember("defaults")) {
    const auto& d = obj["defaults"];
    if (!d.IsObject()) return false;
    std::map<std::string, std::string> values;
    for (auto it = d.MemberBegin(); it != d.MemberEnd(); ++it) {
      if (!it->value.IsString()) return false;
      values[it->name.GetString()] = it->value.GetString();
    }
    out.defaultValues = std::move(values);
  }
  return readStringSet(obj, "inherited", out.inheritedAttributes) &&
         readStringSet(obj, "colorAttributes", out.colorAttributes) &&
         readStringSet(obj, "precisionAttributes", out.precisionAttributes) &&
         readStringSet(obj, "precisionExemptTags", out.precisionExemptTags) &&
         readInt(obj, "startPrecision", out.startPrecision) &&
         readInt(obj, "precisionStep", out.precisionStep);
}

bool readCompliance(const rapidjson::Value& obj, CompliancePolicy& out) {
  if (!readStringSet(obj, "globalAttributes", out.globalAttributes)) return false;
  if (obj.HasMember("tags")) {
    const auto& t = obj["tags"];
    if (!t.IsObject()) return false;
    std::map<std::string, std::set<std::string>> tags;
    for (auto it = t.MemberBegin(); it != t.MemberEnd(); ++it) {
      std::set<std::string> attrs;
      if (!it->value.IsArray()) return false;
      for (const auto& item : it->value.GetArray()) {
        if (!item.IsString()) return false;
        attrs.insert(item.GetString());
      }
      tags[it->name.GetString()] = std::move(attrs);
    }
    out.tagAttributes = std::move(tags);
  }
  return readDouble(obj, "minCanvas", out.minCanvas) &&
         readDouble(obj, "maxCanvas", out.maxCanvas);
}

} // namespace

std::string serializePolicy(const Policy& policy) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  const auto& op = policy.optimizer;
  rapidjson::Value opt(rapidjson::kObjectType);
  rapidjson::Value defaults(rapidjson::kObjectType);
  for (const auto& kv : op.defaultValues) {
    defaults.AddMember(rapidjson::Value(kv.first.c_str(), alloc),
                       rapidjson::Value(kv.second.c_str(), alloc), alloc);
  }
  opt.AddMember("defaults", defaults, alloc);
  opt.AddMember("inherited", stringArray(op.inheritedAttributes, alloc), alloc);
  opt.AddMember("colorAttributes", stringArray(op.colorAttributes, alloc), alloc);
  opt.AddMember("precisionAttributes", stringArray(op.precisionAttributes, alloc), alloc);
  opt.AddMember("precisionExemptTags", stringArray(op.precisionExemptTags, alloc), alloc);
  opt.AddMember("startPrecision", op.startPrecision, alloc);
  opt.AddMember("precisionStep", op.precisionStep, alloc);
  doc.AddMember("optimizer", opt, alloc);

  const auto& cp = policy.compliance;
  rapidjson::Value comp(rapidjson::kObjectType);
  comp.AddMember("globalAttributes", stringArray(cp.globalAttributes, alloc), alloc);
  rapidjson::Value tags(rapidjson::kObjectType);
  for (const auto& kv : cp.tagAttributes) {
    tags.AddMember(rapidjson::Value(kv.first.c_str(), alloc),
                   stringArray(kv.second, alloc), alloc);
  }
  comp.AddMember("tags", tags, alloc);
  comp.AddMember("minCanvas", cp.minCanvas, alloc);
  comp.AddMember("maxCanvas", cp.maxCanvas, alloc);
  doc.AddMember("compliance", comp, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializePolicy(const std::string& json, Policy& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  // Work on a copy so a half-applied overlay never leaks out.
  Policy next = out;
  if (doc.HasMember("optimizer")) {
    if (!doc["optimizer"].IsObject() || !readOptimizer(doc["optimizer"], next.optimizer)) return false;
  }
  if (doc.HasMember("compliance")) {
    if (!doc["compliance"].IsObject() || !readCompliance(doc["compliance"], next.compliance)) return false;
  }
  if (next.optimizer.startPrecision < 0 || next.optimizer.precisionStep <= 0) return false;

  out = std::move(next);
  return true;
}

} // namespace vb
