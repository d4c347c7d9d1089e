#include "TunerEngine.hpp"
#include "vtuner/app_settings_io.hpp"
#include "vtuner/tone_player.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>

using namespace vtuner;

std::atomic<bool> g_running(true);

void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* argv0) {
    std::cout << "Violin Tuner\n"
              << "Usage: " << argv0 << " [options]\n"
              << "  --device <name>       ALSA capture device (default: from settings)\n"
              << "  --string <G|D|A|E>    Reference string (default: A)\n"
              << "  --settings <path>     Settings file (default: violin_tuner.json)\n"
              << "  --save-settings       Write the effective settings back to the file\n"
              << "  --play                Play the reference tone and exit\n"
              << "  --duration-ms <n>     Reference tone length\n"
              << "  --auto-stop <seconds> Stop listening after this long (0 = never)\n"
              << "  --normalized          Normalize correlation by overlap length\n"
              << "  --simulate <hz>       Use a synthetic sine instead of the microphone\n"
              << "  --help                Show this help\n";
}

static audio::TunerEngineConfig make_engine_config(const AppSettings& st) {
    audio::TunerEngineConfig cfg;
    cfg.audio.device_name = st.device_name;
    cfg.audio.sample_rate = static_cast<unsigned int>(st.sample_rate);
    cfg.audio.block_size = static_cast<unsigned int>(st.block_size);
    cfg.audio.period_size = static_cast<unsigned int>(st.period_size);
    cfg.audio.use_realtime_priority = st.use_realtime_priority;
    cfg.pitch.mode = st.normalize_correlation ? dsp::CorrelationMode::PerOverlap : dsp::CorrelationMode::Raw;
    cfg.auto_stop = std::chrono::seconds(st.auto_stop_seconds);
    return cfg;
}

static int play_reference(const AppSettings& st, StringName name) {
    ToneConfig tone_cfg;
    tone_cfg.device_name = st.tone_device;
    tone_cfg.default_duration_ms = st.tone_duration_ms;
    auto player = createTonePlayer(tone_cfg);

    const ReferenceString& ref = reference_string(name);
    std::cout << "Playing " << ref.label << " (" << ref.frequency_hz << " Hz) for "
              << st.tone_duration_ms << " ms" << std::endl;
    if (!player->play(ref.frequency_hz, st.tone_duration_ms)) {
        std::cerr << "Tone playback failed: " << player->last_error() << std::endl;
        return 1;
    }
    while (player->is_playing() && g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    player->stop();
    const std::string err = player->last_error();
    if (!err.empty()) {
        std::cerr << "Tone playback failed: " << err << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string settings_path = "violin_tuner.json";
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--settings" && i + 1 < argc) settings_path = argv[i + 1];
    }

    AppSettings settings;
    if (load_settings(settings_path.c_str(), settings)) {
        std::cout << "Loaded settings from " << settings_path << std::endl;
    }

    std::string string_name = "A";
    bool play = false;
    bool save = false;
    double simulate_hz = 0.0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--device" && i + 1 < argc) {
            settings.device_name = argv[++i];
        } else if (arg == "--string" && i + 1 < argc) {
            string_name = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            ++i;
        } else if (arg == "--save-settings") {
            save = true;
        } else if (arg == "--play") {
            play = true;
        } else if (arg == "--duration-ms" && i + 1 < argc) {
            settings.tone_duration_ms = std::atoi(argv[++i]);
        } else if (arg == "--auto-stop" && i + 1 < argc) {
            settings.auto_stop_seconds = std::atoi(argv[++i]);
        } else if (arg == "--normalized") {
            settings.normalize_correlation = true;
        } else if (arg == "--simulate" && i + 1 < argc) {
            simulate_hz = std::atof(argv[++i]);
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    StringName selected = StringName::A;
    if (!parse_string_name(string_name, selected)) {
        std::cerr << "Unknown string '" << string_name << "', expected G, D, A or E" << std::endl;
        return 1;
    }
    sanitize_settings(settings);

    if (save) {
        if (save_settings(settings_path.c_str(), settings)) {
            std::cout << "Saved settings to " << settings_path << std::endl;
        } else {
            std::cerr << "Cannot write settings to " << settings_path << std::endl;
        }
    }

    if (play) return play_reference(settings, selected);

    audio::TunerEngineConfig engine_cfg = make_engine_config(settings);
    engine_cfg.initial_string = selected;

    std::unique_ptr<audio::TunerEngine> engine;
    if (simulate_hz > 0.0) {
        SineSourceConfig sine;
        sine.frequency_hz = simulate_hz;
        engine = std::make_unique<audio::TunerEngine>(engine_cfg, [sine](const AudioConfig& c) {
            return createSineAudioInput(c, sine);
        });
    } else {
        engine = std::make_unique<audio::TunerEngine>(engine_cfg);
    }

    const ReferenceString& ref = reference_string(selected);
    std::cout << "Target: " << ref.label << " " << ref.frequency_hz << " Hz\n"
              << "Press Ctrl+C to exit\n\n";

    if (!engine->start_listening()) {
        std::cerr << "Failed to start audio: " << engine->last_error() << std::endl;
        return 1;
    }

    while (g_running.load()) {
        TuningResult result;
        if (engine->wait_result(result, std::chrono::milliseconds(250))) {
            std::cout << std::fixed << std::setprecision(1)
                      << std::setw(7) << result.frequency_hz << " Hz  "
                      << std::showpos << std::setw(6) << result.cents_deviation << " cents" << std::noshowpos
                      << "  " << describe(result) << std::endl;
        } else if (!engine->is_listening()) {
            if (engine->auto_stopped()) std::cout << "Listening stopped" << std::endl;
            else if (!engine->last_error().empty()) std::cerr << "Capture ended: " << engine->last_error() << std::endl;
            break;
        }
    }

    engine->stop_listening();

    auto stats = engine->get_latency_stats();
    std::cout << "\nStats: avg=" << stats.avg_ms << "ms, xruns=" << stats.xruns << std::endl;
    return 0;
}
