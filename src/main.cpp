#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/chip8.hpp"
#include "../include/chip8_clock.hpp"

//=====================================================================
//
// Static locals
//
//=====================================================================

static const unsigned s_defaultFrames = 600; // ten seconds at 60 fps
static const unsigned s_frameHz       =  60;

//=====================================================================
static bool ParseUnsigned (const char * text, unsigned * out) {
    char * end = nullptr;
    const unsigned long value = std::strtoul(text, &end, 0);
    if (!*text || *end)
        return false;
    *out = unsigned(value);
    return true;
}

//=====================================================================
static void PrintDisplay (const Chip8Display & display) {
    const uint8_t * pixels = display.Snapshot();
    for (unsigned y = 0; y < Chip8Display::s_renderHeight; ++y) {
        for (unsigned x = 0; x < Chip8Display::s_renderWidth; ++x)
            std::fputc(pixels[y * Chip8Display::s_renderWidth + x] ? '#' : '.', stdout);
        std::fputc('\n', stdout);
    }
}


//=====================================================================
//
// Entry point
//
//=====================================================================

//=====================================================================
int main (int argc, char ** argv) {

    if (argc < 2 || argc > 5) {
        std::fprintf(stderr, "usage: %s <rom> [frames] [cyclesPerFrame] [seed]\n", argv[0]);
        return EXIT_FAILURE;
    }

    unsigned         frames = s_defaultFrames;
    unsigned         seed   = 0;
    Chip8ClockConfig config;
    if (
        (argc > 2 && !ParseUnsigned(argv[2], &frames)) ||
        (argc > 3 && !ParseUnsigned(argv[3], &config.cyclesPerFrame)) ||
        (argc > 4 && !ParseUnsigned(argv[4], &seed))
    ) {
        std::fprintf(stderr, "chip8vm-run: Arguments must be unsigned integers.\n");
        return EXIT_FAILURE;
    }

    std::fprintf(
        stderr,
        "chip8vm-run: {%s}, %u frames, %u cycles/frame, timers at %u Hz, seed %u.\n",
        argv[1],
        frames,
        config.cyclesPerFrame,
        config.timerHz,
        seed
    );

    Chip8 chip8;
    chip8.Initialize(seed);
    if (!chip8.LoadProgramFile(argv[1]))
        return EXIT_FAILURE;

    typedef std::chrono::steady_clock Clock;
    const auto framePeriod = std::chrono::microseconds(1000000 / s_frameHz);

    Chip8Clock clock(config);
    bool       beeping = false;
    auto       last    = Clock::now();
    for (unsigned frame = 0; frame < frames; ++frame) {
        const auto   now     = Clock::now();
        const double elapsed = std::chrono::duration<double>(now - last).count();
        last = now;

        const bool running = clock.RunFrame(chip8, elapsed);

        // Audio collaborator: beep once each time the tone starts.
        if (chip8.SoundActive() && !beeping)
            CSaruCore::Beep();
        beeping = chip8.SoundActive();

        chip8.m_drawFlag = false;
        if (!running)
            break;

        std::this_thread::sleep_until(now + framePeriod);
    }

    PrintDisplay(chip8.m_display);

    if (chip8.IsHalted()) {
        std::fprintf(
            stderr,
            "chip8vm-run: Stopped on %s after %llu cycles.\n",
            Chip8FaultName(chip8.m_fault),
            static_cast<unsigned long long>(clock.m_cycles)
        );
        return EXIT_FAILURE;
    }

    std::fprintf(
        stderr,
        "chip8vm-run: Ran %llu cycles and %llu timer ticks.\n",
        static_cast<unsigned long long>(clock.m_cycles),
        static_cast<unsigned long long>(clock.m_ticks)
    );
    return EXIT_SUCCESS;

}
