#pragma once

#include "PranaError.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * Commands understood by the recuperator firmware
 */
enum class PranaCommand : uint8_t {
    Power,          // toggles power
    Heating,        // toggles mini heating
    NightMode,
    HighSpeed,
    FlowLock,       // toggles locked (balanced) flows
    SpeedDown,
    SpeedUp,
    FlowInToggle,
    SpeedInUp,
    SpeedInDown,
    FlowOutToggle,
    SpeedOutUp,
    SpeedOutDown,
    WinterMode,     // toggles winter mode
    ReadState,
    ReadDetails
};

/**
 * Frame - Decoded command or response frame
 */
struct Frame {
    PranaCommand command = PranaCommand::ReadState;
    uint8_t kind = 0;
    uint8_t code = 0;
    std::vector<uint8_t> payload;   // bytes between header and checksum
    std::vector<uint8_t> raw;       // complete frame as received
};

/**
 * FrameCodec - Wire format of the recuperator protocol
 *
 * This class handles:
 * - Building command frames from command + parameters
 * - Validating and parsing inbound frames
 *
 * Frame format:
 *   [0xBE] [0xEF] [kind (1 byte)] [code (1 byte)] [parameters (variable)] [checksum]
 *
 * The checksum is the low 8 bits of the sum of every preceding byte.
 * Each BLE write or notification carries exactly one frame.
 *
 * The codec is pure: no I/O and no state between calls. Pairing a response
 * with its request is up to the caller (see matches()).
 */
class FrameCodec {
public:
    static constexpr uint8_t PREFIX_HIGH = 0xBE;
    static constexpr uint8_t PREFIX_LOW = 0xEF;
    static constexpr uint8_t KIND_CONTROL = 0x04;
    static constexpr uint8_t KIND_QUERY = 0x05;

    static constexpr size_t HEADER_SIZE = 4;     // prefix + kind + code
    static constexpr size_t MIN_FRAME_SIZE = 5;  // header + checksum
    static constexpr size_t MAX_FRAME_SIZE = 128;
    static constexpr size_t QUERY_PARAM_SIZE = 4;

    /**
     * Build a frame for a command
     * @param command Command to encode
     * @param params Parameter bytes, sent as given
     * @param out Output: encoded frame
     * @return None, or InvalidArgument if the frame would exceed MAX_FRAME_SIZE
     */
    static PranaError encode(PranaCommand command, const std::vector<uint8_t>& params,
                             std::vector<uint8_t>& out);

    /**
     * Validate and parse an inbound frame
     * @param data Received bytes
     * @param len Number of received bytes
     * @param out Output: parsed frame
     * @return None, MalformedFrame (prefix/length/checksum) or
     *         UnexpectedCommand (unknown kind/code)
     */
    static PranaError decode(const uint8_t* data, size_t len, Frame& out);

    /**
     * Check that a response echoes the request's command
     */
    static bool matches(PranaCommand request, const Frame& response);

    /**
     * Compute the frame checksum over len bytes
     */
    static uint8_t checksum(const uint8_t* data, size_t len);

    /**
     * Get the wire kind/code for a command
     */
    static void codeFor(PranaCommand command, uint8_t& kind, uint8_t& code);

    /**
     * Resolve a wire kind/code pair
     * @return true if the pair names a known command
     */
    static bool lookup(uint8_t kind, uint8_t code, PranaCommand& out);

    /**
     * Get the API name of a command (e.g. "speed_up")
     */
    static const char* commandName(PranaCommand command);

    /**
     * Resolve an API command name
     * @return true if the name is known
     */
    static bool parseCommandName(const char* name, PranaCommand& out);

    /**
     * Check whether a command is a query (reads state, changes nothing)
     */
    static bool isQuery(PranaCommand command);
};
