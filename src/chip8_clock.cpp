#include "../include/chip8.hpp"
#include "../include/chip8_clock.hpp"

//=====================================================================
Chip8Clock::Chip8Clock (const Chip8ClockConfig & config)
    : m_config(config)
    , m_timerAccumulator(0.0)
    , m_cycles(0)
    , m_ticks(0)
{}

//=====================================================================
void Chip8Clock::Reset () {
    m_timerAccumulator = 0.0;
    m_cycles           = 0;
    m_ticks            = 0;
}

//=====================================================================
bool Chip8Clock::RunFrame (Chip8 & chip8, double elapsedSeconds) {

    bool running = true;
    for (unsigned i = 0; i < m_config.cyclesPerFrame; ++i) {
        if (!chip8.EmulateCycle()) {
            running = false;
            break;
        }
        ++m_cycles;
    }

    if (!m_config.timerHz)
        return running;

    // Timers track wall-clock time even while the machine is halted or
    // waiting on a key. At most one tick per frame; the remainder carries.
    const double tickPeriod = 1.0 / m_config.timerHz;
    if (elapsedSeconds > 0.0)
        m_timerAccumulator += elapsedSeconds;
    if (m_timerAccumulator >= tickPeriod) {
        chip8.TickTimers();
        m_timerAccumulator -= tickPeriod;
        ++m_ticks;
    }

    return running;

}
