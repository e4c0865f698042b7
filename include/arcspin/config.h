#pragma once

#include <arcspin/base/object.h>
#include <arcspin/base/factory.h>
#include <arcspin/result.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arcspin {

//=============================================================================
// SpinnerSettings - validated view of the spinner related config keys
//=============================================================================
struct SpinnerSettings {
    bool largeStyle = false;
    std::vector<uint32_t> colors;
    uint32_t background = 0;
    bool arrow = false;
    float arrowScale = 1.0f;
    int alpha = 255;
    float density = 1.0f;
    int size = 48;
    int fps = 60;
};

//=============================================================================
// Config - layered YAML configuration
//
// Layers, last wins: built-in defaults, config file, ARCSPIN_* environment
// variables, command line overrides. Keys are slash paths ("spinner/style").
//=============================================================================
class Config : public base::Object,
               public base::ObjectFactory<Config> {
public:
    using Ptr = base::ObjectFactory<Config>::Ptr;

    // Empty configPath means the XDG default, which may be absent
    static Result<Ptr> createImpl(ContextType&, const std::string& configPath,
                                  const YAML::Node& cmdOverrides);
    static Result<Ptr> createImpl(ContextType&, const std::string& configPath);
    static Result<Ptr> createImpl(ContextType&);

    ~Config() override = default;
    const char* typeName() const override { return "Config"; }

    // Returns nullopt if the key is missing or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    std::vector<std::string> getList(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // File actually loaded, empty when running on defaults
    const std::string& loadedPath() const { return _loadedPath; }

    Result<SpinnerSettings> spinnerSettings() const;

    static std::filesystem::path getXDGConfigPath();

    // Convert slash path to env var name ("spinner/arrow-scale" -> "ARCSPIN_SPINNER_ARROW_SCALE")
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "ARCSPIN_";

    static constexpr const char* KEY_SPINNER_STYLE = "spinner/style";
    static constexpr const char* KEY_SPINNER_COLORS = "spinner/colors";
    static constexpr const char* KEY_SPINNER_BACKGROUND = "spinner/background";
    static constexpr const char* KEY_SPINNER_ARROW = "spinner/arrow";
    static constexpr const char* KEY_SPINNER_ARROW_SCALE = "spinner/arrow-scale";
    static constexpr const char* KEY_SPINNER_ALPHA = "spinner/alpha";
    static constexpr const char* KEY_DISPLAY_DENSITY = "display/density";
    static constexpr const char* KEY_DISPLAY_SIZE = "display/size";
    static constexpr const char* KEY_ANIMATION_FPS = "animation/fps";
    static constexpr const char* KEY_LOGGING_LEVEL = "logging/level";

private:
    Config(std::string configPath, YAML::Node cmdOverrides);
    Result<void> init();

    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(const YAML::Node& node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace arcspin
