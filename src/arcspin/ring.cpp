#include <arcspin/ring.h>
#include <string>

namespace arcspin {

Ring::Ring() : _colors{color::CYAN}, _currentColor(color::CYAN) {}

Result<void> Ring::setColors(std::vector<uint32_t> colors) {
    if (colors.empty()) {
        return Err<void>("Ring::setColors: palette must not be empty");
    }
    _colors = std::move(colors);
    // A new palette always restarts from its first entry
    resetColorIndex();
    return Ok();
}

Result<void> Ring::setColorIndex(int index) {
    if (index < 0 || index >= static_cast<int>(_colors.size())) {
        return Err<void>("Ring::setColorIndex: index " + std::to_string(index) +
                         " out of range for palette of " + std::to_string(_colors.size()));
    }
    _colorIndex = index;
    _currentColor = _colors[_colorIndex];
    return Ok();
}

void Ring::goToNextColor() {
    _colorIndex = nextColorIndex();
    _currentColor = _colors[_colorIndex];
}

void Ring::resetColorIndex() {
    _colorIndex = 0;
    _currentColor = _colors[0];
}

void Ring::storeOriginals() {
    _originals = {_startTrim, _endTrim, _rotation};
    _hasOriginals = true;
}

void Ring::resetOriginals() {
    _originals = {};
    _hasOriginals = true;
    _startTrim = 0;
    _endTrim = 0;
    _rotation = 0;
}

Result<void> Ring::setAlpha(int alpha) {
    if (alpha < 0 || alpha > 255) {
        return Err<void>("Ring::setAlpha: alpha " + std::to_string(alpha) + " outside [0,255]");
    }
    _alpha = alpha;
    return Ok();
}

void Ring::setArrowDimensions(float width, float height) {
    _arrowWidth = static_cast<int>(width);
    _arrowHeight = static_cast<int>(height);
}

} // namespace arcspin
