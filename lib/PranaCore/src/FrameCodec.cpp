#include "FrameCodec.hpp"
#include <cstring>

// Define static constexpr members for pre-C++17 ODR compliance
constexpr uint8_t FrameCodec::PREFIX_HIGH;
constexpr uint8_t FrameCodec::PREFIX_LOW;
constexpr uint8_t FrameCodec::KIND_CONTROL;
constexpr uint8_t FrameCodec::KIND_QUERY;
constexpr size_t FrameCodec::HEADER_SIZE;
constexpr size_t FrameCodec::MIN_FRAME_SIZE;
constexpr size_t FrameCodec::MAX_FRAME_SIZE;
constexpr size_t FrameCodec::QUERY_PARAM_SIZE;

namespace {

struct CommandEntry {
    PranaCommand command;
    uint8_t kind;
    uint8_t code;
    const char* name;
};

const CommandEntry COMMAND_TABLE[] = {
    { PranaCommand::Power,         FrameCodec::KIND_CONTROL, 0x01, "power" },
    { PranaCommand::Heating,       FrameCodec::KIND_CONTROL, 0x05, "heating" },
    { PranaCommand::NightMode,     FrameCodec::KIND_CONTROL, 0x06, "night_mode" },
    { PranaCommand::HighSpeed,     FrameCodec::KIND_CONTROL, 0x07, "high_speed" },
    { PranaCommand::FlowLock,      FrameCodec::KIND_CONTROL, 0x09, "flow_lock" },
    { PranaCommand::SpeedDown,     FrameCodec::KIND_CONTROL, 0x0B, "speed_down" },
    { PranaCommand::SpeedUp,       FrameCodec::KIND_CONTROL, 0x0C, "speed_up" },
    { PranaCommand::FlowInToggle,  FrameCodec::KIND_CONTROL, 0x0D, "flow_in" },
    { PranaCommand::SpeedInUp,     FrameCodec::KIND_CONTROL, 0x0E, "speed_in_up" },
    { PranaCommand::SpeedInDown,   FrameCodec::KIND_CONTROL, 0x0F, "speed_in_down" },
    { PranaCommand::FlowOutToggle, FrameCodec::KIND_CONTROL, 0x10, "flow_out" },
    { PranaCommand::SpeedOutUp,    FrameCodec::KIND_CONTROL, 0x11, "speed_out_up" },
    { PranaCommand::SpeedOutDown,  FrameCodec::KIND_CONTROL, 0x12, "speed_out_down" },
    { PranaCommand::WinterMode,    FrameCodec::KIND_CONTROL, 0x16, "winter_mode" },
    { PranaCommand::ReadState,     FrameCodec::KIND_QUERY,   0x01, "read_state" },
    { PranaCommand::ReadDetails,   FrameCodec::KIND_QUERY,   0x02, "read_details" },
};

const CommandEntry* findEntry(PranaCommand command) {
    for (const CommandEntry& entry : COMMAND_TABLE) {
        if (entry.command == command) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace

uint8_t FrameCodec::checksum(const uint8_t* data, size_t len) {
    uint8_t sum = 0;
    for (size_t i = 0; i < len; i++) {
        sum = static_cast<uint8_t>(sum + data[i]);
    }
    return sum;
}

void FrameCodec::codeFor(PranaCommand command, uint8_t& kind, uint8_t& code) {
    const CommandEntry* entry = findEntry(command);
    kind = entry != nullptr ? entry->kind : 0;
    code = entry != nullptr ? entry->code : 0;
}

bool FrameCodec::lookup(uint8_t kind, uint8_t code, PranaCommand& out) {
    for (const CommandEntry& entry : COMMAND_TABLE) {
        if (entry.kind == kind && entry.code == code) {
            out = entry.command;
            return true;
        }
    }
    return false;
}

const char* FrameCodec::commandName(PranaCommand command) {
    const CommandEntry* entry = findEntry(command);
    return entry != nullptr ? entry->name : "unknown";
}

bool FrameCodec::parseCommandName(const char* name, PranaCommand& out) {
    if (name == nullptr) {
        return false;
    }
    for (const CommandEntry& entry : COMMAND_TABLE) {
        if (strcmp(entry.name, name) == 0) {
            out = entry.command;
            return true;
        }
    }
    return false;
}

bool FrameCodec::isQuery(PranaCommand command) {
    const CommandEntry* entry = findEntry(command);
    return entry != nullptr && entry->kind == KIND_QUERY;
}

PranaError FrameCodec::encode(PranaCommand command, const std::vector<uint8_t>& params,
                              std::vector<uint8_t>& out) {
    uint8_t kind = 0;
    uint8_t code = 0;
    codeFor(command, kind, code);
    if (kind == 0) {
        return PranaError::InvalidArgument;
    }

    size_t totalLen = HEADER_SIZE + params.size() + 1;
    if (totalLen > MAX_FRAME_SIZE) {
        return PranaError::InvalidArgument;
    }

    out.clear();
    out.reserve(totalLen);
    out.push_back(PREFIX_HIGH);
    out.push_back(PREFIX_LOW);
    out.push_back(kind);
    out.push_back(code);
    out.insert(out.end(), params.begin(), params.end());
    out.push_back(checksum(out.data(), out.size()));
    return PranaError::None;
}

PranaError FrameCodec::decode(const uint8_t* data, size_t len, Frame& out) {
    if (data == nullptr || len < MIN_FRAME_SIZE || len > MAX_FRAME_SIZE) {
        return PranaError::MalformedFrame;
    }

    if (data[0] != PREFIX_HIGH || data[1] != PREFIX_LOW) {
        return PranaError::MalformedFrame;
    }

    if (checksum(data, len - 1) != data[len - 1]) {
        return PranaError::MalformedFrame;
    }

    PranaCommand command;
    if (!lookup(data[2], data[3], command)) {
        return PranaError::UnexpectedCommand;
    }

    out.command = command;
    out.kind = data[2];
    out.code = data[3];
    out.payload.assign(data + HEADER_SIZE, data + len - 1);
    out.raw.assign(data, data + len);
    return PranaError::None;
}

bool FrameCodec::matches(PranaCommand request, const Frame& response) {
    uint8_t kind = 0;
    uint8_t code = 0;
    codeFor(request, kind, code);
    return response.kind == kind && response.code == code;
}
