//=============================================================================
// arcspin-demo - render or play the progress spinner
//
// Headless mode renders N frames at the configured rate and prints the scene
// YAML of the last frame (or of every frame with --all). Live mode plays the
// spinner on the event loop and logs the frame state.
//=============================================================================

#include <arcspin/base/event-loop.h>
#include <arcspin/color.h>
#include <arcspin/config.h>
#include <arcspin/draw-list.h>
#include <arcspin/progress-drawable.h>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace arcspin;

namespace {

struct Options {
    std::string configPath;
    YAML::Node cmdOverrides;
    int frames = 1;
    bool all = false;
    std::string output;
    double liveSeconds = 0;
    float pull = 0;
    bool verbose = false;
};

Result<Options> parseArgs(int argc, char* argv[]) {
    args::ArgumentParser parser("arcspin-demo - circular progress spinner");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path",
                                            {'c', "config"});
    args::ValueFlag<std::string> styleArg(parser, "style", "Spinner style: default or large",
                                          {'s', "style"});
    args::ValueFlag<std::string> colorsArg(parser, "colors",
                                           "Comma separated palette, e.g. #FF0000,#00FF00",
                                           {"colors"});
    args::ValueFlag<int> sizeArg(parser, "pixels", "Drawable bounds in pixels", {"size"});
    args::ValueFlag<float> densityArg(parser, "density", "Display density", {"density"});
    args::ValueFlag<int> fpsArg(parser, "fps", "Frame rate", {"fps"});
    args::Flag arrowFlag(parser, "arrow", "Show the arrow head", {"arrow"});
    args::ValueFlag<float> pullArg(parser, "fraction",
                                   "Start from a partly drawn arc (0..1), as after a pull gesture",
                                   {"pull"});

    args::ValueFlag<int> framesArg(parser, "count", "Render this many frames headless",
                                   {'n', "frames"});
    args::Flag allFlag(parser, "all", "Print every frame, not only the last", {"all"});
    args::ValueFlag<std::string> outputArg(parser, "file", "Write YAML here instead of stdout",
                                           {'o', "output"});
    args::ValueFlag<double> liveArg(parser, "seconds", "Play on the event loop", {"live"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<Options>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<Options>(std::string("Parse error: ") + e.what());
    }

    Options opts;
    if (styleArg) {
        opts.cmdOverrides["spinner"]["style"] = args::get(styleArg);
    }
    if (colorsArg) {
        YAML::Node colors(YAML::NodeType::Sequence);
        std::istringstream ss(args::get(colorsArg));
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) colors.push_back(item);
        }
        opts.cmdOverrides["spinner"]["colors"] = colors;
    }
    if (arrowFlag) {
        opts.cmdOverrides["spinner"]["arrow"] = true;
    }
    if (sizeArg) {
        opts.cmdOverrides["display"]["size"] = args::get(sizeArg);
    }
    if (densityArg) {
        opts.cmdOverrides["display"]["density"] = args::get(densityArg);
    }
    if (fpsArg) {
        opts.cmdOverrides["animation"]["fps"] = args::get(fpsArg);
    }

    opts.configPath = configFile ? args::get(configFile) : "";
    opts.frames = framesArg ? args::get(framesArg) : 1;
    opts.all = allFlag;
    opts.output = outputArg ? args::get(outputArg) : "";
    opts.liveSeconds = liveArg ? args::get(liveArg) : 0.0;
    opts.pull = pullArg ? args::get(pullArg) : 0.0f;
    opts.verbose = verboseFlag;

    if (opts.frames <= 0) {
        return Err<Options>("--frames must be positive");
    }
    if (opts.pull < 0.0f || opts.pull > 1.0f) {
        return Err<Options>("--pull must be within [0, 1]");
    }
    return Ok(std::move(opts));
}

Result<ProgressDrawable::Ptr> createSpinner(const SpinnerSettings& s, float pull) {
    auto res = ProgressDrawable::create(s.density);
    if (!res) {
        return Err<ProgressDrawable::Ptr>("Failed to create spinner", res);
    }
    auto spinner = *res;

    spinner->setStyle(s.largeStyle ? ProgressDrawable::Style::Large
                                   : ProgressDrawable::Style::Default);
    if (auto r = spinner->setColorSchemeColors(s.colors); !r) {
        return Err<ProgressDrawable::Ptr>("Invalid palette", r);
    }
    if (auto r = spinner->setAlpha(s.alpha); !r) {
        return Err<ProgressDrawable::Ptr>("Invalid alpha", r);
    }
    spinner->setBackgroundColor(s.background);
    spinner->setArrowEnabled(s.arrow);
    spinner->setArrowScale(s.arrowScale);
    spinner->setBounds({0, 0, static_cast<float>(s.size), static_cast<float>(s.size)});

    if (pull > 0.0f) {
        spinner->setStartEndTrim(0.0f, pull * RingAnimator::MAX_PROGRESS_ARC);
    }
    return Ok(spinner);
}

//=============================================================================
// Headless rendering
//=============================================================================

Result<void> renderFrames(ProgressDrawable::Ptr spinner, const Options& opts,
                          const SpinnerSettings& s) {
    auto listRes = DrawList::create();
    if (!listRes) {
        return Err<void>("Failed to create draw list", listRes);
    }
    auto list = *listRes;
    list->setSceneBounds(static_cast<float>(s.size), static_cast<float>(s.size));

    if (auto res = spinner->start(); !res) {
        return Err<void>("Failed to start spinner", res);
    }

    const double frameMs = 1000.0 / s.fps;
    std::ostringstream out;
    for (int i = 0; i < opts.frames; ++i) {
        if (i > 0) {
            if (auto res = spinner->tick(frameMs); !res) {
                return Err<void>("Frame " + std::to_string(i) + " failed", res);
            }
        }
        if (opts.all || i == opts.frames - 1) {
            list->clear();
            spinner->draw(*list);
            out << "---\n" << list->toYaml() << "\n";
        }
        auto f = spinner->frame();
        ydebug("frame {}: trim=[{:.4f}, {:.4f}] rotation={:.4f} group={:.1f} color={}",
               i, f.startTrim, f.endTrim, f.rotation, f.groupRotation,
               color::formatColor(f.color));
    }

    if (opts.output.empty()) {
        std::cout << out.str();
        return Ok();
    }
    std::ofstream file(opts.output);
    if (!file) {
        return Err<void>("Cannot open " + opts.output + " for writing");
    }
    file << out.str();
    yinfo("Wrote {} frame(s) to {}", opts.all ? opts.frames : 1, opts.output);
    return Ok();
}

//=============================================================================
// Live playback on the event loop
//=============================================================================

class SpinnerPlayer : public base::EventListener {
public:
    using Ptr = std::shared_ptr<SpinnerPlayer>;

    SpinnerPlayer(ProgressDrawable::Ptr spinner, base::EventLoop::Ptr loop, double playMs)
        : _spinner(std::move(spinner)), _loop(std::move(loop)), _playMs(playMs) {}

    const char* typeName() const override { return "SpinnerPlayer"; }

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type == base::Event::Type::Invalidate) {
            _invalidations++;
            return Ok(true);
        }
        if (event.type != base::Event::Type::Timer) return Ok(false);

        // Advance by measured wall time so playback keeps real speed
        const double deltaMs = event.timer.deltaMs;
        if (auto res = _spinner->tick(deltaMs); !res) {
            return Err<bool>("SpinnerPlayer: tick failed", res);
        }
        _playedMs += deltaMs;

        auto list = DrawList::create();
        if (!list) {
            return Err<bool>("SpinnerPlayer: draw list", list);
        }
        _spinner->draw(**list);

        if (event.timer.fireCount % 30 == 0) {
            auto f = _spinner->frame();
            yinfo("frame {} at {:.1f}ms (+{:.2f}): trim=[{:.3f}, {:.3f}] group={:.1f} color={} prims={} redraws={}",
                  event.timer.fireCount, _playedMs, deltaMs, f.startTrim, f.endTrim,
                  f.groupRotation, color::formatColor(f.color), (*list)->size(), _invalidations);
        }
        if (_playedMs >= _playMs) {
            _spinner->stop();
            if (auto res = _loop->stop(); !res) {
                return Err<bool>("SpinnerPlayer: stop loop", res);
            }
        }
        return Ok(true);
    }

private:
    ProgressDrawable::Ptr _spinner;
    base::EventLoop::Ptr _loop;
    double _playMs;
    double _playedMs = 0.0;
    uint64_t _invalidations = 0;
};

Result<void> playLive(ProgressDrawable::Ptr spinner, double seconds, const SpinnerSettings& s) {
    auto loopRes = base::EventLoop::instance();
    if (!loopRes) {
        return Err<void>("No event loop", loopRes);
    }
    auto loop = *loopRes;

    const int intervalMs = std::max(1, static_cast<int>(std::lround(1000.0 / s.fps)));
    auto player = std::make_shared<SpinnerPlayer>(spinner, loop, seconds * 1000.0);

    const base::ObjectId spinnerId = spinner->id();
    spinner->setInvalidateCallback([loop, spinnerId]() {
        if (auto res = loop->dispatch(base::Event::invalidateEvent(spinnerId)); !res) {
            ywarn("invalidate dispatch failed: {}", error_msg(res));
        }
    });
    if (auto res = loop->registerListener(base::Event::Type::Invalidate, player); !res) {
        return Err<void>("Failed to register redraw listener", res);
    }

    auto timer = loop->addTimer(intervalMs, player);
    if (!timer) {
        return Err<void>("Failed to create frame timer", timer);
    }
    if (auto res = spinner->start(); !res) {
        return Err<void>("Failed to start spinner", res);
    }
    if (auto res = loop->startTimer(*timer); !res) {
        return Err<void>("Failed to start frame timer", res);
    }

    yinfo("Playing {:.1f}s at a {} ms frame interval", seconds, intervalMs);
    loop->start();

    spinner->setInvalidateCallback(nullptr);
    if (auto res = loop->destroyTimer(*timer); !res) {
        return Err<void>("Failed to destroy frame timer", res);
    }
    // The loop has returned; run the timer's close callback now
    if (auto res = loop->drain(); !res) {
        return Err<void>("Failed to release frame timer", res);
    }
    return loop->deregisterListener(player);
}

} // namespace

int main(int argc, char* argv[]) {
    auto optsRes = parseArgs(argc, argv);
    if (!optsRes) {
        if (optsRes.error().message() == "Help requested") {
            return 0;
        }
        std::cerr << "arcspin-demo: " << error_msg(optsRes) << std::endl;
        return 1;
    }
    const Options& opts = *optsRes;

    auto configRes = Config::create(opts.configPath, opts.cmdOverrides);
    if (!configRes) {
        std::cerr << "arcspin-demo: " << error_msg(configRes) << std::endl;
        return 1;
    }
    auto config = *configRes;

    auto level = spdlog::level::from_str(config->get<std::string>(Config::KEY_LOGGING_LEVEL, "info"));
    spdlog::set_level(opts.verbose ? spdlog::level::debug : level);
    spdlog::cfg::load_env_levels();

    auto settings = config->spinnerSettings();
    if (!settings) {
        yerror("Invalid configuration: {}", error_msg(settings));
        return 1;
    }

    auto spinner = createSpinner(*settings, opts.pull);
    if (!spinner) {
        yerror("{}", error_msg(spinner));
        return 1;
    }

    auto res = opts.liveSeconds > 0.0
        ? playLive(*spinner, opts.liveSeconds, *settings)
        : renderFrames(*spinner, opts, *settings);
    if (!res) {
        yerror("arcspin-demo failed: {}", error_msg(res));
        return 1;
    }
    return 0;
}
