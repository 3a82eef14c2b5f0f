#include "avr/diagnostics/diagnostic_log_sink.h"
#include <json/json.h>
#include "avr/common/logging.h"

#include <cmath>

namespace avr {
namespace diagnostics {

namespace {

// MOVEMENT_STATE keeps 4 decimals for position and 6 for velocity,
// every other line uses 3.
constexpr int kDefaultDecimals = 3;
constexpr int kMovePositionDecimals = 4;
constexpr int kMoveVelocityDecimals = 6;

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

double round3(float value) {
    return roundTo(value, kDefaultDecimals);
}

Json::Value vec3Json(const glm::vec3& v, int decimals = kDefaultDecimals) {
    Json::Value out(Json::arrayValue);
    out.append(roundTo(v.x, decimals));
    out.append(roundTo(v.y, decimals));
    out.append(roundTo(v.z, decimals));
    return out;
}

Json::Value velocityJson(const state::Velocity& velocity, int decimals = kDefaultDecimals) {
    Json::Value out(Json::objectValue);
    out["x"] = roundTo(velocity.x, decimals);
    out["z"] = roundTo(velocity.z, decimals);
    out["speed"] = roundTo(velocity.speed, decimals);
    return out;
}

template<typename Container>
Json::Value stringArray(const Container& values) {
    Json::Value out(Json::arrayValue);
    for (const auto& value : values) {
        out.append(value);
    }
    return out;
}

} // namespace

DiagnosticLogSink::DiagnosticLogSink(state::EventBus& bus, std::ostream& out)
    : m_bus(bus)
    , m_out(out)
{
    m_handle = m_bus.subscribe([this](const state::AvatarEvent& event) {
        write(event);
    });
}

DiagnosticLogSink::~DiagnosticLogSink() {
    m_bus.unsubscribe(m_handle);
}

const char* DiagnosticLogSink::tagFor(state::AvatarEventType type) {
    switch (type) {
        case state::AvatarEventType::MovementUpdated:       return "MOVEMENT_STATE";
        case state::AvatarEventType::KeyStateChanged:       return "KEYS";
        case state::AvatarEventType::AnimationChanged:      return "ANIM";
        case state::AvatarEventType::ClipsStripped:         return "CLIPS";
        case state::AvatarEventType::TransformSnapshot:     return "WORLD";
        case state::AvatarEventType::ContainerCreated:      return "AVATAR_METRICS";
        case state::AvatarEventType::InstanceStatusChanged: return "AVATAR_INSTANCE";
        case state::AvatarEventType::SetupFailed:           return "SETUP_FAIL";
    }
    return "UNKNOWN";
}

Json::Value DiagnosticLogSink::toJson(const state::AvatarEvent& event) {
    Json::Value out(Json::objectValue);

    if (auto* data = std::get_if<state::MovementUpdatedData>(&event.data)) {
        out["position"] = vec3Json(data->state.position, kMovePositionDecimals);
        out["isMoving"] = data->state.isMoving;
        out["isRunning"] = data->state.isRunning;
        out["activeKeys"] = stringArray(data->state.activeKeys);
        out["velocity"] = velocityJson(data->state.velocity, kMoveVelocityDecimals);
    }
    else if (auto* data = std::get_if<state::KeyStateChangedData>(&event.data)) {
        out["type"] = data->down ? "down" : "up";
        out["code"] = data->code;
        out["keys"] = stringArray(data->keys);
    }
    else if (auto* data = std::get_if<state::AnimationChangedData>(&event.data)) {
        out["avatar"] = data->avatarId;
        out["clip"] = data->clip;
        out["moving"] = data->moving;
    }
    else if (auto* data = std::get_if<state::ClipsStrippedData>(&event.data)) {
        out["avatar"] = data->avatarId;
        out["clips"] = stringArray(data->clips);
        out["originalPositionTrackCount"] = data->originalPositionTrackCount;
        out["strippedPositionTrackCount"] = data->strippedPositionTrackCount;
    }
    else if (auto* data = std::get_if<state::TransformSnapshotData>(&event.data)) {
        out["avatar"] = data->avatarId;
        out["clock"] = roundTo(data->clock, kDefaultDecimals);
        out["containerLocal"] = vec3Json(data->localPosition);
        out["containerWorld"] = vec3Json(data->worldPosition);
        out["velocity"] = velocityJson(data->velocity);
        out["isMoving"] = data->isMoving;
        if (data->avatarHeight >= 0.0f) {
            out["avatarHeight"] = round3(data->avatarHeight);
        } else {
            out["avatarHeight"] = Json::Value(Json::nullValue);
        }
    }
    else if (auto* data = std::get_if<state::ContainerCreatedData>(&event.data)) {
        out["name"] = data->avatarId;
        out["height"] = round3(data->height);
        out["bboxMin"] = vec3Json(data->bboxMin);
        out["bboxMax"] = vec3Json(data->bboxMax);
        out["containerScale"] = vec3Json(data->containerScale);
        out["pivotLocal"] = vec3Json(data->pivotLocal);
    }
    else if (auto* data = std::get_if<state::InstanceStatusChangedData>(&event.data)) {
        out["avatar"] = data->avatarId;
        out["status"] = state::instanceStatusName(data->status);
        if (data->status == state::InstanceStatus::DuplicateBlocked) {
            out["existingInstance"] = data->existingInstanceId;
            out["newInstance"] = data->instanceId;
        } else {
            out["instance"] = data->instanceId;
        }
    }
    else if (auto* data = std::get_if<state::SetupFailedData>(&event.data)) {
        out["avatar"] = data->avatarId;
        out["reason"] = data->reason;
        out["error"] = avatarErrorName(data->error);
    }

    return out;
}

std::string DiagnosticLogSink::formatLine(const state::AvatarEvent& event) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = kMoveVelocityDecimals;
    builder["precisionType"] = "decimal";
    return std::string("TPJ ") + tagFor(event.type) + " " + Json::writeString(builder, toJson(event));
}

void DiagnosticLogSink::write(const state::AvatarEvent& event) {
    m_out << formatLine(event) << '\n';
    m_out.flush();
    ++m_linesWritten;
    LOG_TRACE(MOD_DIAG, "Wrote {} diagnostic line", tagFor(event.type));
}

} // namespace diagnostics
} // namespace avr
