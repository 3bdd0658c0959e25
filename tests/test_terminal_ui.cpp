// =============================================================================
// Unit tests for the terminal UI (pure parts: key decoding, input translation,
// frame rendering). No terminal is needed.
// =============================================================================
#include <gtest/gtest.h>
#include <poll.h>
#include <string>
#include <vector>
#include "terminal_ui.hpp"

using namespace pilot;

namespace {

DeviceRecord record(const std::string& id, DeviceState state = DeviceState::Online) {
    DeviceRecord rec;
    rec.device.id = id;
    rec.device.transport = classifyTransport(id);
    rec.device.label = defaultLabel(id);
    rec.device.state = state;
    return rec;
}

Snapshot threeDevices() {
    Snapshot snap;
    snap.devices = {record("AAA111"), record("BBB222"), record("CCC333")};
    return snap;
}

// First rendered line containing `needle`, or empty
std::string lineWith(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& l : lines) {
        if (l.find(needle) != std::string::npos) return l;
    }
    return std::string();
}

} // namespace

// =============================================================================
// decodeKeys
// =============================================================================

TEST(DecodeKeysTest, LettersAndControlKeys) {
    auto keys = decodeKeys("jkxraq\r");
    EXPECT_EQ(keys, (std::vector<Key>{Key::Down, Key::Up, Key::Stop, Key::Restart,
                                      Key::Acknowledge, Key::Quit, Key::Start}));
    EXPECT_EQ(decodeKeys("S\n"), (std::vector<Key>{Key::Start, Key::Start}));
    EXPECT_EQ(decodeKeys("\x03"), (std::vector<Key>{Key::Quit}));
}

TEST(DecodeKeysTest, ArrowSequences) {
    EXPECT_EQ(decodeKeys("\x1b[A\x1b[B"), (std::vector<Key>{Key::Up, Key::Down}));
    EXPECT_EQ(decodeKeys("\x1bOA\x1bOB"), (std::vector<Key>{Key::Up, Key::Down}));
    // Right arrow is not bound
    EXPECT_EQ(decodeKeys("\x1b[C"), (std::vector<Key>{Key::Unknown}));
}

TEST(DecodeKeysTest, ParameterizedCsiIsOneKey) {
    // Ctrl-Up, Shift-Down, Home, PageUp
    EXPECT_EQ(decodeKeys("\x1b[1;5A"), (std::vector<Key>{Key::Up}));
    EXPECT_EQ(decodeKeys("\x1b[1;2B"), (std::vector<Key>{Key::Down}));
    EXPECT_EQ(decodeKeys("\x1b[1~\x1b[5~j"),
              (std::vector<Key>{Key::Unknown, Key::Unknown, Key::Down}));
}

TEST(DecodeKeysTest, TruncatedCsiDoesNotLeakKeys) {
    EXPECT_EQ(decodeKeys("\x1b[1;5"), (std::vector<Key>{Key::Unknown}));
    EXPECT_EQ(decodeKeys("\x1b["), (std::vector<Key>{Key::Unknown}));
}

TEST(DecodeKeysTest, BareEscapeQuits) {
    EXPECT_EQ(decodeKeys("\x1b"), (std::vector<Key>{Key::Quit}));
}

TEST(DecodeKeysTest, UnboundBytesAreUnknown) {
    EXPECT_EQ(decodeKeys("z?"), (std::vector<Key>{Key::Unknown, Key::Unknown}));
    EXPECT_TRUE(decodeKeys("").empty());
}

TEST(ClassifyPollTest, HangupIsClosed) {
    EXPECT_EQ(classifyPoll(POLLIN), PollInput::Data);
    EXPECT_EQ(classifyPoll(POLLIN | POLLHUP), PollInput::Data);
    EXPECT_EQ(classifyPoll(POLLHUP), PollInput::Closed);
    EXPECT_EQ(classifyPoll(POLLERR), PollInput::Closed);
    EXPECT_EQ(classifyPoll(POLLNVAL), PollInput::Closed);
    EXPECT_EQ(classifyPoll(0), PollInput::None);
}

// =============================================================================
// translateInput
// =============================================================================

TEST(TranslateInputTest, SelectionDefaultsToFirstDevice) {
    UiState state;
    auto snap = threeDevices();
    auto cmds = translateInput("s", state, snap);
    ASSERT_EQ(cmds.size(), 1u);
    EXPECT_EQ(cmds[0].kind, CommandKind::Start);
    EXPECT_EQ(cmds[0].device_id, "AAA111");
    EXPECT_EQ(state.selected_id, "AAA111");
}

TEST(TranslateInputTest, NavigationStopsAtTheEnds) {
    UiState state;
    auto snap = threeDevices();

    translateInput("k", state, snap);
    EXPECT_EQ(state.selected_id, "AAA111");

    translateInput("jjjj", state, snap);
    EXPECT_EQ(state.selected_id, "CCC333");

    translateInput("\x1b[A", state, snap);
    EXPECT_EQ(state.selected_id, "BBB222");
}

TEST(TranslateInputTest, CommandsTargetTheSelectedDevice) {
    UiState state;
    state.selected_id = "BBB222";
    auto snap = threeDevices();

    auto cmds = translateInput("xrajs", state, snap);
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0].kind, CommandKind::Stop);
    EXPECT_EQ(cmds[1].kind, CommandKind::Restart);
    EXPECT_EQ(cmds[2].kind, CommandKind::Acknowledge);
    EXPECT_EQ(cmds[2].device_id, "BBB222");
    EXPECT_EQ(cmds[3].kind, CommandKind::Start);
    EXPECT_EQ(cmds[3].device_id, "CCC333");
}

TEST(TranslateInputTest, QuitEndsTheBatch) {
    UiState state;
    auto snap = threeDevices();
    auto cmds = translateInput("sqx", state, snap);
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[1].kind, CommandKind::Quit);
    EXPECT_TRUE(cmds[1].device_id.empty());
}

TEST(TranslateInputTest, NoDevicesMeansNoDeviceCommands) {
    UiState state;
    state.selected_id = "GONE";
    Snapshot empty;
    auto cmds = translateInput("sxj", state, empty);
    EXPECT_TRUE(cmds.empty());
    EXPECT_TRUE(state.selected_id.empty());

    // Quit still works
    cmds = translateInput("q", state, empty);
    ASSERT_EQ(cmds.size(), 1u);
    EXPECT_EQ(cmds[0].kind, CommandKind::Quit);
}

TEST(TranslateInputTest, VanishedSelectionFallsBackToFirst) {
    UiState state;
    state.selected_id = "ZZZ999";
    auto snap = threeDevices();
    clampSelection(state, snap);
    EXPECT_EQ(state.selected_id, "AAA111");
}

// =============================================================================
// renderFrame
// =============================================================================

TEST(RenderFrameTest, ShowsDevicesSessionsAndStatus) {
    Snapshot snap = threeDevices();
    snap.devices[2].missed_polls = 1;

    SessionInfo running;
    running.device_id = "AAA111";
    running.state = SessionState::Running;
    running.pid = 4321;
    SessionInfo failed;
    failed.device_id = "BBB222";
    failed.state = SessionState::Failed;
    failed.failure_reason = "exit code 1";
    failed.restart_count = 2;
    snap.sessions = {running, failed};

    UiState state;
    state.selected_id = "BBB222";
    auto lines = renderFrame(snap, state, 40, 120, false);

    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines[0].find("scrcpy-pilot"), std::string::npos);
    EXPECT_NE(lineWith(lines, "adb: ok").find("devices: 3   mirroring: 1"), std::string::npos);
    EXPECT_FALSE(lineWith(lines, "SERIAL").empty());

    std::string a = lineWith(lines, "AAA111");
    EXPECT_NE(a.find("Running"), std::string::npos);
    EXPECT_NE(a.find("4321"), std::string::npos);
    EXPECT_NE(a.find("usb"), std::string::npos);
    EXPECT_EQ(a.find('>'), std::string::npos);

    std::string b = lineWith(lines, "BBB222");
    EXPECT_EQ(b.rfind(" >", 0), 0u);
    EXPECT_NE(b.find("Failed"), std::string::npos);
    EXPECT_NE(b.find("exit code 1"), std::string::npos);
    EXPECT_NE(b.find(" 2 "), std::string::npos);

    std::string c = lineWith(lines, "CCC333");
    EXPECT_NE(c.find("Stopped"), std::string::npos);
    EXPECT_NE(c.find("missing"), std::string::npos);

    // No escape codes when color is off
    for (const auto& l : lines) EXPECT_EQ(l.find('\x1b'), std::string::npos);
}

TEST(RenderFrameTest, EmptyDeviceListHint) {
    Snapshot snap;
    auto lines = renderFrame(snap, UiState{}, 30, 100, false);
    EXPECT_FALSE(lineWith(lines, "No devices").empty());
}

TEST(RenderFrameTest, DiscoveryUnavailableStatus) {
    Snapshot snap = threeDevices();
    snap.discovery_available = false;
    snap.discovery_error = "adb timed out after 5000ms";
    auto lines = renderFrame(snap, UiState{}, 30, 100, false);
    EXPECT_FALSE(lineWith(lines, "adb: unavailable (adb timed out after 5000ms)").empty());
    // Last known devices are still listed
    EXPECT_FALSE(lineWith(lines, "AAA111").empty());
}

TEST(RenderFrameTest, ShutdownStatus) {
    Snapshot snap = threeDevices();
    snap.shutting_down = true;
    SessionInfo stopping;
    stopping.device_id = "AAA111";
    stopping.state = SessionState::Stopping;
    stopping.pid = 77;
    snap.sessions = {stopping};
    auto lines = renderFrame(snap, UiState{}, 30, 100, false);
    EXPECT_FALSE(lineWith(lines, "Shutting down... 1 session(s) still stopping").empty());
}

TEST(RenderFrameTest, NoticeAndRestartPending) {
    Snapshot snap = threeDevices();
    snap.notice = "start AAA111: session already active";
    SessionInfo s;
    s.device_id = "AAA111";
    s.state = SessionState::Stopping;
    s.restart_pending = true;
    snap.sessions = {s};

    auto lines = renderFrame(snap, UiState{}, 30, 120, false);
    EXPECT_FALSE(lineWith(lines, " ! start AAA111: session already active").empty());
    EXPECT_NE(lineWith(lines, "AAA111 ").find("restarting"), std::string::npos);
}

TEST(RenderFrameTest, LogTailNewestFirst) {
    Snapshot snap;
    snap.log_tail = {LogEntry{"10:00:00", LogLevel::Info, "first"},
                     LogEntry{"10:00:01", LogLevel::Error, "second"}};
    auto lines = renderFrame(snap, UiState{}, 40, 100, false);

    size_t first = lines.size(), second = lines.size();
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i] == " 10:00:00 [info] first") first = i;
        if (lines[i] == " 10:00:01 [error] second") second = i;
    }
    ASSERT_LT(first, lines.size());
    ASSERT_LT(second, lines.size());
    EXPECT_LT(second, first);
}

TEST(RenderFrameTest, ClipsToRowsAndColumns) {
    Snapshot snap = threeDevices();
    for (int i = 0; i < 50; i++) {
        snap.log_tail.push_back(LogEntry{"10:00:00", LogLevel::Info, std::string(200, 'x')});
    }

    auto lines = renderFrame(snap, UiState{}, 12, 40, false);
    EXPECT_EQ(lines.size(), 12u);
    for (const auto& l : lines) EXPECT_LE(l.size(), 40u);

    EXPECT_TRUE(renderFrame(snap, UiState{}, 0, 40, false).empty());
    EXPECT_TRUE(renderFrame(snap, UiState{}, 10, 0, false).empty());
}

TEST(RenderFrameTest, ColorWrapsClippedText) {
    Snapshot snap = threeDevices();
    auto lines = renderFrame(snap, UiState{}, 30, 20, true);
    ASSERT_FALSE(lines.empty());
    // Header is inverted and padded to exactly the clip width
    EXPECT_EQ(lines[0], std::string("\x1b[7m") + " scrcpy-pilot 0.3.0 " + "\x1b[0m");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
