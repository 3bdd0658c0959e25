#pragma once
// =============================================================================
// scrcpy-pilot - Terminal UI
// =============================================================================
// Full-screen ANSI dashboard. Reads the latest Snapshot each frame and posts
// UserCommands; it never touches devices or sessions directly. The only state
// it keeps is the cursor (selected device id).
//
// renderFrame() and translateInput() are pure so they can be tested without a
// terminal. TerminalUi::run() wires them to termios raw mode and poll().
// =============================================================================

#include <atomic>
#include <string>
#include <vector>
#include "command_channel.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "result.hpp"
#include "snapshot.hpp"

namespace pilot {

struct UiState {
    std::string selected_id;    // empty = nothing selected
};

enum class Key { Up, Down, Start, Stop, Restart, Acknowledge, Quit, Unknown };

enum class PollInput { None, Data, Closed };

// What a poll() on the terminal reported: readable, hung up/errored, or neither
PollInput classifyPoll(short revents);

// Split raw terminal input into keys. CSI sequences are consumed through
// their final byte, so modified arrows (ESC [ 1 ; 5 A) are one key.
std::vector<Key> decodeKeys(const std::string& bytes);

// Keep the cursor on an existing device; falls back to the first one
void clampSelection(UiState& state, const Snapshot& snap);

// Apply navigation to `state` and return the commands to post, in order
std::vector<UserCommand> translateInput(const std::string& bytes, UiState& state,
                                        const Snapshot& snap);

// One frame, at most `rows` lines, each clipped to `cols` visible columns
std::vector<std::string> renderFrame(const Snapshot& snap, const UiState& state,
                                     int rows, int cols, bool color = true);

class TerminalUi {
public:
    TerminalUi(const config::UiConfig& cfg, SnapshotStore& store, CommandChannel& channel,
               EventBus& events = bus());

    // Blocks until `stop` is set. Fails if stdin/stdout is not a terminal.
    // `interrupted` is polled each frame; when it is set a ShutdownRequest
    // is posted once.
    Result<void> run(const std::atomic<bool>& stop, const std::atomic<bool>& interrupted);

private:
    void drawFrame(const Snapshot& snap);

    config::UiConfig cfg_;
    SnapshotStore& store_;
    CommandChannel& channel_;
    EventBus& events_;
    UiState state_;
    std::atomic<bool> bell_{false};
};

} // namespace pilot
