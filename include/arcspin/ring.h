#pragma once

#include <arcspin/color.h>
#include <arcspin/result.hpp>
#include <cstdint>
#include <vector>

namespace arcspin {

enum class StrokeCap : uint8_t {
    Butt,
    Round,
    Square,
};

//=============================================================================
// StartingSnapshot - baseline of one animation cycle, taken by storeOriginals()
//=============================================================================
struct StartingSnapshot {
    float startTrim = 0;
    float endTrim = 0;
    float rotation = 0;
};

//=============================================================================
// Ring - visual state of the progress arc
//
// Trims and rotation are fractions of a full turn. colorIndex always points
// into a non-empty palette; currentColor is what gets drawn this frame.
//=============================================================================
class Ring {
public:
    Ring();

    // Palette
    Result<void> setColors(std::vector<uint32_t> colors);
    const std::vector<uint32_t>& colors() const { return _colors; }

    Result<void> setColorIndex(int index);
    int colorIndex() const { return _colorIndex; }

    int nextColorIndex() const {
        return (_colorIndex + 1) % static_cast<int>(_colors.size());
    }
    uint32_t nextColor() const { return _colors[nextColorIndex()]; }
    uint32_t startingColor() const { return _colors[_colorIndex]; }

    // Moves to the next palette entry, wrapping at the end
    void goToNextColor();
    void resetColorIndex();

    void setColor(uint32_t color) { _currentColor = color; }
    uint32_t currentColor() const { return _currentColor; }

    // Arc
    void setStartTrim(float startTrim) { _startTrim = startTrim; }
    float startTrim() const { return _startTrim; }
    void setEndTrim(float endTrim) { _endTrim = endTrim; }
    float endTrim() const { return _endTrim; }
    void setRotation(float rotation) { _rotation = rotation; }
    float rotation() const { return _rotation; }

    // Snapshot
    void storeOriginals();
    void resetOriginals();
    bool hasOriginals() const { return _hasOriginals; }
    const StartingSnapshot& originals() const { return _originals; }

    // Geometry and paint
    void setStrokeWidth(float strokeWidth) { _strokeWidth = strokeWidth; }
    float strokeWidth() const { return _strokeWidth; }
    void setCenterRadius(float centerRadius) { _centerRadius = centerRadius; }
    float centerRadius() const { return _centerRadius; }
    void setStrokeCap(StrokeCap cap) { _strokeCap = cap; }
    StrokeCap strokeCap() const { return _strokeCap; }
    void setBackgroundColor(uint32_t color) { _backgroundColor = color; }
    uint32_t backgroundColor() const { return _backgroundColor; }

    Result<void> setAlpha(int alpha);
    int alpha() const { return _alpha; }

    // Arrow head; dimensions are kept in whole pixels
    void setArrowDimensions(float width, float height);
    float arrowWidth() const { return static_cast<float>(_arrowWidth); }
    float arrowHeight() const { return static_cast<float>(_arrowHeight); }
    void setShowArrow(bool show) { _showArrow = show; }
    bool showArrow() const { return _showArrow; }
    void setArrowScale(float scale) { _arrowScale = scale; }
    float arrowScale() const { return _arrowScale; }

private:
    float _startTrim = 0;
    float _endTrim = 0;
    float _rotation = 0;
    float _strokeWidth = 5;
    float _centerRadius = 0;

    std::vector<uint32_t> _colors;
    int _colorIndex = 0;
    uint32_t _currentColor = 0;

    StartingSnapshot _originals;
    bool _hasOriginals = false;

    bool _showArrow = false;
    float _arrowScale = 1;
    int _arrowWidth = 0;
    int _arrowHeight = 0;

    int _alpha = 255;
    uint32_t _backgroundColor = color::TRANSPARENT;
    StrokeCap _strokeCap = StrokeCap::Square;
};

} // namespace arcspin
