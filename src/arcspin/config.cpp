#include <arcspin/config.h>
#include <arcspin/color.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace arcspin {

namespace {

const char* DEFAULT_CONFIG = R"(
spinner:
  style: default
  colors: ["#FF00FFFF"]
  background: "#00000000"
  arrow: false
  arrow-scale: 1.0
  alpha: 255
display:
  density: 1.0
  size: 48
animation:
  fps: 60
logging:
  level: info
)";

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::vector<std::string> splitList(const std::string& str) {
    std::vector<std::string> items;
    std::istringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos) {
            items.push_back(item.substr(b, e - b + 1));
        }
    }
    return items;
}

// Wrap `leaf` in maps along `parts`: {a: {b: leaf}}
YAML::Node nestAt(const std::vector<std::string>& parts, const YAML::Node& leaf) {
    YAML::Node node = leaf;
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        YAML::Node parent(YAML::NodeType::Map);
        parent[*it] = node;
        node.reset(parent);
    }
    return node;
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

Config::Config(std::string configPath, YAML::Node cmdOverrides)
    : _configPath(std::move(configPath)), _cmdOverrides(std::move(cmdOverrides)) {}

Result<Config::Ptr> Config::createImpl(ContextType&, const std::string& configPath,
                                       const YAML::Node& cmdOverrides) {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::createImpl(ContextType& ctx, const std::string& configPath) {
    return createImpl(ctx, configPath, YAML::Node());
}

Result<Config::Ptr> Config::createImpl(ContextType& ctx) {
    return createImpl(ctx, std::string(), YAML::Node());
}

Result<void> Config::init() {
    try {
        _config = YAML::Load(DEFAULT_CONFIG);
    } catch (const YAML::Exception& e) {
        return Err<void>("Built-in defaults do not parse: " + std::string(e.what()));
    }

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            _loadedPath = effectivePath;
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(YAML::Clone(_config), "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config root must be a map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

// Walks a snapshot of the tree; every known leaf can be overridden
void Config::applyEnvOverrides(const YAML::Node& node, const std::string& prefix) {
    if (!node.IsMap()) return;

    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        const YAML::Node& value = it->second;

        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* env = std::getenv(envVar.c_str());
        if (!env) continue;

        std::string s(env);
        YAML::Node leaf;
        if (value.IsSequence()) {
            leaf = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& item : splitList(s)) {
                leaf.push_back(item);
            }
        } else if (s == "1" || s == "0") {
            std::string current = value.IsScalar() ? value.as<std::string>() : "";
            bool isBool = current == "true" || current == "false";
            leaf = isBool ? YAML::Node(s == "1") : YAML::Node(s);
        } else {
            leaf = YAML::Node(s);
        }

        mergeNodes(_config, nestAt(splitPath(fullPath), leaf));
        ydebug("Config override from env: {}={}", envVar, s);
    }
}

//=============================================================================
// Queries
//=============================================================================

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

std::vector<std::string> Config::getList(const std::string& path) const {
    YAML::Node node = getNode(path);
    std::vector<std::string> result;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) result.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        result = splitList(node.as<std::string>());
    }
    return result;
}

Result<SpinnerSettings> Config::spinnerSettings() const {
    SpinnerSettings s;

    auto style = get<std::string>(KEY_SPINNER_STYLE, "default");
    if (style == "large") {
        s.largeStyle = true;
    } else if (style != "default") {
        return Err<SpinnerSettings>("Unknown spinner style '" + style + "'");
    }

    for (const auto& str : getList(KEY_SPINNER_COLORS)) {
        auto c = color::parseColor(str);
        if (!c) {
            return Err<SpinnerSettings>(std::string(KEY_SPINNER_COLORS), c);
        }
        s.colors.push_back(*c);
    }
    if (s.colors.empty()) {
        return Err<SpinnerSettings>("spinner/colors must not be empty");
    }

    auto bg = color::parseColor(get<std::string>(KEY_SPINNER_BACKGROUND, "#00000000"));
    if (!bg) {
        return Err<SpinnerSettings>(std::string(KEY_SPINNER_BACKGROUND), bg);
    }
    s.background = *bg;

    s.arrow = get<bool>(KEY_SPINNER_ARROW, false);
    s.arrowScale = get<float>(KEY_SPINNER_ARROW_SCALE, 1.0f);
    s.alpha = get<int>(KEY_SPINNER_ALPHA, 255);
    if (s.alpha < 0 || s.alpha > 255) {
        return Err<SpinnerSettings>("spinner/alpha out of range: " + std::to_string(s.alpha));
    }

    s.density = get<float>(KEY_DISPLAY_DENSITY, 1.0f);
    if (!(s.density > 0.0f)) {
        return Err<SpinnerSettings>("display/density must be positive");
    }
    s.size = get<int>(KEY_DISPLAY_SIZE, 48);
    if (s.size <= 0) {
        return Err<SpinnerSettings>("display/size must be positive");
    }
    s.fps = get<int>(KEY_ANIMATION_FPS, 60);
    if (s.fps <= 0 || s.fps > 1000) {
        return Err<SpinnerSettings>("animation/fps out of range: " + std::to_string(s.fps));
    }
    return Ok(std::move(s));
}

//=============================================================================
// Helpers
//=============================================================================

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-' || c == '.') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "arcspin" / "config.yaml";
}

} // namespace arcspin
