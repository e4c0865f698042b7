#pragma once

#include <arcspin/canvas.h>
#include <arcspin/base/object.h>
#include <arcspin/base/factory.h>
#include <arcspin/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace arcspin {

//=============================================================================
// DrawPrim - one recorded primitive in scene coordinates
//=============================================================================
struct DrawPrim {
    enum class Type : uint8_t { Circle, Arc, Triangle };

    Type type = Type::Circle;
    Paint paint;

    // Circle and Arc
    PointF center;
    float radiusX = 0;
    float radiusY = 0;

    // Arc, degrees with the canvas rotation folded in
    float startAngle = 0;
    float sweepAngle = 0;

    // Triangle
    PointF points[3];
};

//=============================================================================
// DrawList - recording Canvas
//
// Keeps a rotation stack and resolves it at record time, so every stored
// primitive is in scene coordinates. Fully transparent primitives are not
// recorded. toYaml() writes the list as an arcspin scene document.
//=============================================================================
class DrawList : public Canvas,
                 public base::Object,
                 public base::ObjectFactory<DrawList> {
public:
    using Ptr = std::shared_ptr<DrawList>;

    static Result<Ptr> createImpl();

    ~DrawList() override = default;
    const char* typeName() const override { return "DrawList"; }

    // --- Canvas ---
    void save() override;
    void restore() override;
    void rotate(float degrees, float px, float py) override;

    void drawCircle(float cx, float cy, float radius, const Paint& paint) override;
    void drawArc(const RectF& oval, float startAngle, float sweepAngle,
                 const Paint& paint) override;
    void drawTriangle(PointF p0, PointF p1, PointF p2, const Paint& paint) override;

    // --- Recorded data ---
    const std::vector<DrawPrim>& prims() const { return _prims; }
    size_t size() const { return _prims.size(); }
    bool empty() const { return _prims.empty(); }
    void clear();

    void setSceneBounds(float width, float height) {
        _sceneWidth = width;
        _sceneHeight = height;
    }

    // Scene YAML: optional scene size, then a body list of circle, arc and
    // triangle items. Arcs are stroked sections given by start-angle and
    // sweep-angle.
    std::string toYaml() const;
    Result<void> writeYaml(const std::string& path) const;

protected:
    DrawList() = default;

private:
    // Rigid transform: rotation by `degrees` then translation
    struct Transform {
        float cos = 1, sin = 0;
        float tx = 0, ty = 0;
        float degrees = 0;

        PointF apply(PointF p) const {
            return {cos * p.x - sin * p.y + tx, sin * p.x + cos * p.y + ty};
        }
    };

    Transform _current;
    std::vector<Transform> _stack;
    std::vector<DrawPrim> _prims;
    float _sceneWidth = 0;
    float _sceneHeight = 0;
};

} // namespace arcspin
