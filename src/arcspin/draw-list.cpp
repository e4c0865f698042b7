#include <arcspin/draw-list.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <cstdio>
#include <fstream>

namespace arcspin {

namespace {

constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;

// Colors are written as "#RRGGBBAA", the form color::parseColor reads back
std::string hexColor(uint32_t argb) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X",
                  color::red(argb), color::green(argb), color::blue(argb),
                  color::alpha(argb));
    return buf;
}

const char* capName(StrokeCap cap) {
    switch (cap) {
        case StrokeCap::Butt:   return "butt";
        case StrokeCap::Round:  return "round";
        case StrokeCap::Square: return "square";
    }
    return "butt";
}

void emitPoint(YAML::Emitter& out, const char* key, PointF p) {
    out << YAML::Key << key << YAML::Value
        << YAML::Flow << YAML::BeginSeq << p.x << p.y << YAML::EndSeq;
}

void emitPaint(YAML::Emitter& out, const Paint& paint) {
    if (paint.style == Paint::Style::Fill) {
        out << YAML::Key << "fill" << YAML::Value << hexColor(paint.color);
    } else {
        out << YAML::Key << "stroke" << YAML::Value << hexColor(paint.color);
        out << YAML::Key << "stroke-width" << YAML::Value << paint.strokeWidth;
    }
}

} // namespace

Result<DrawList::Ptr> DrawList::createImpl() {
    return Ok(Ptr(new DrawList()));
}

//=============================================================================
// Transform stack
//=============================================================================

void DrawList::save() {
    _stack.push_back(_current);
}

void DrawList::restore() {
    if (_stack.empty()) {
        ywarn("DrawList::restore: unbalanced restore ignored");
        return;
    }
    _current = _stack.back();
    _stack.pop_back();
}

void DrawList::rotate(float degrees, float px, float py) {
    // new = current * T(p) * R * T(-p)
    float rad = degrees * DEG_TO_RAD;
    float c = std::cos(rad);
    float s = std::sin(rad);

    // Local rotation about (px, py): x' = R x + (p - R p)
    float ltx = px - (c * px - s * py);
    float lty = py - (s * px + c * py);

    Transform next;
    next.cos = _current.cos * c - _current.sin * s;
    next.sin = _current.sin * c + _current.cos * s;
    next.tx = _current.cos * ltx - _current.sin * lty + _current.tx;
    next.ty = _current.sin * ltx + _current.cos * lty + _current.ty;
    next.degrees = _current.degrees + degrees;
    _current = next;
}

//=============================================================================
// Recording
//=============================================================================

void DrawList::drawCircle(float cx, float cy, float radius, const Paint& paint) {
    if (color::alpha(paint.color) == 0) return;

    DrawPrim prim;
    prim.type = DrawPrim::Type::Circle;
    prim.paint = paint;
    prim.center = _current.apply({cx, cy});
    prim.radiusX = radius;
    prim.radiusY = radius;
    _prims.push_back(prim);
}

void DrawList::drawArc(const RectF& oval, float startAngle, float sweepAngle,
                       const Paint& paint) {
    if (color::alpha(paint.color) == 0) return;

    DrawPrim prim;
    prim.type = DrawPrim::Type::Arc;
    prim.paint = paint;
    prim.center = _current.apply({oval.centerX(), oval.centerY()});
    prim.radiusX = oval.width() * 0.5f;
    prim.radiusY = oval.height() * 0.5f;
    prim.startAngle = startAngle + _current.degrees;
    prim.sweepAngle = sweepAngle;
    _prims.push_back(prim);
}

void DrawList::drawTriangle(PointF p0, PointF p1, PointF p2, const Paint& paint) {
    if (color::alpha(paint.color) == 0) return;

    DrawPrim prim;
    prim.type = DrawPrim::Type::Triangle;
    prim.paint = paint;
    prim.points[0] = _current.apply(p0);
    prim.points[1] = _current.apply(p1);
    prim.points[2] = _current.apply(p2);
    _prims.push_back(prim);
}

void DrawList::clear() {
    _prims.clear();
    _stack.clear();
    _current = Transform{};
}

//=============================================================================
// YAML output
//=============================================================================

std::string DrawList::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    if (_sceneWidth > 0 && _sceneHeight > 0) {
        out << YAML::Key << "scene" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "size" << YAML::Value
            << YAML::Flow << YAML::BeginSeq << _sceneWidth << _sceneHeight << YAML::EndSeq;
        out << YAML::EndMap;
    }

    out << YAML::Key << "body" << YAML::Value << YAML::BeginSeq;
    for (const auto& prim : _prims) {
        out << YAML::BeginMap;
        switch (prim.type) {
            case DrawPrim::Type::Circle:
                out << YAML::Key << "circle" << YAML::Value << YAML::BeginMap;
                emitPoint(out, "position", prim.center);
                out << YAML::Key << "radius" << YAML::Value << prim.radiusX;
                emitPaint(out, prim.paint);
                out << YAML::EndMap;
                break;

            case DrawPrim::Type::Arc:
                out << YAML::Key << "arc" << YAML::Value << YAML::BeginMap;
                emitPoint(out, "position", prim.center);
                out << YAML::Key << "radius" << YAML::Value << prim.radiusX;
                // Degrees clockwise from +x, already including the rotation stack
                out << YAML::Key << "start-angle" << YAML::Value << prim.startAngle;
                out << YAML::Key << "sweep-angle" << YAML::Value << prim.sweepAngle;
                out << YAML::Key << "cap" << YAML::Value << capName(prim.paint.cap);
                emitPaint(out, prim.paint);
                out << YAML::EndMap;
                break;

            case DrawPrim::Type::Triangle:
                out << YAML::Key << "triangle" << YAML::Value << YAML::BeginMap;
                emitPoint(out, "p0", prim.points[0]);
                emitPoint(out, "p1", prim.points[1]);
                emitPoint(out, "p2", prim.points[2]);
                emitPaint(out, prim.paint);
                out << YAML::EndMap;
                break;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

Result<void> DrawList::writeYaml(const std::string& path) const {
    std::ofstream file(path);
    if (!file) {
        return Err<void>("Cannot open " + path + " for writing");
    }
    file << toYaml() << "\n";
    if (!file) {
        return Err<void>("Failed writing " + path);
    }
    ydebug("DrawList::writeYaml: {} prims -> {}", _prims.size(), path);
    return Ok();
}

} // namespace arcspin
