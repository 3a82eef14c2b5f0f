#pragma once

#include <ostream>
#include <string>

#include "avr/state/event_bus.h"

namespace Json { class Value; }

namespace avr {
namespace diagnostics {

/**
 * DiagnosticLogSink - Writes avatar events as "TPJ <TAG> <json>" lines.
 *
 * One line per event, JSON on a single line. MOVEMENT_STATE rounds
 * position to 4 decimals and velocity to 6; all other floats are rounded
 * to 3. Log-analysis tooling parses these lines; the MOVEMENT_STATE
 * payload is
 *   {"position":[x,y,z],"isMoving":b,"isRunning":b,"activeKeys":[...],
 *    "velocity":{"x":..,"z":..,"speed":..}}
 * and must keep that shape.
 */
class DiagnosticLogSink {
public:
    DiagnosticLogSink(state::EventBus& bus, std::ostream& out);
    ~DiagnosticLogSink();

    DiagnosticLogSink(const DiagnosticLogSink&) = delete;
    DiagnosticLogSink& operator=(const DiagnosticLogSink&) = delete;

    static const char* tagFor(state::AvatarEventType type);
    static Json::Value toJson(const state::AvatarEvent& event);
    static std::string formatLine(const state::AvatarEvent& event);

    size_t linesWritten() const { return m_linesWritten; }

private:
    void write(const state::AvatarEvent& event);

    state::EventBus& m_bus;
    std::ostream& m_out;
    state::ListenerHandle m_handle;
    size_t m_linesWritten = 0;
};

} // namespace diagnostics
} // namespace avr
