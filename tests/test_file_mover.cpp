#include "FileMover.hpp"

#include "TempDir.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

PlannedMove makeMove(const fs::path& source, const fs::path& dest) {
    PlannedMove planned;
    planned.source = source;
    planned.dest = dest;
    planned.folderName = dest.parent_path().filename().string();
    planned.fileName = dest.filename().string();
    return planned;
}

MoveHooks crossDeviceRename() {
    MoveHooks hooks;
    hooks.rename = [](const fs::path&, const fs::path&, std::error_code& ec) {
        ec = std::make_error_code(std::errc::cross_device_link);
    };
    return hooks;
}

void testCreatesDirectoriesAndMoves() {
    TempDir temp("tagmv_mover_basic");
    const auto source = temp.path() / "source.txt";
    const auto dest = temp.path() / "deep" / "er" / "dest.txt";
    writeFile(source, "test content");

    const MoveResult result = FileMover{}.executeMove(makeMove(source, dest));
    assert(result.ok());
    assert(!fs::exists(source));
    assert(fs::exists(dest));
    assert(readFile(dest) == "test content");
}

void testNoOpTouchesNothing() {
    const fs::path same("/nonexistent-tagmv/same.mp3");
    MoveHooks hooks;
    bool renameCalled = false;
    hooks.rename = [&renameCalled](const fs::path&, const fs::path&, std::error_code&) { renameCalled = true; };

    const MoveResult result = FileMover(hooks).executeMove(makeMove(same, same));
    assert(result.ok());
    assert(!renameCalled);
    assert(!fs::exists(same.parent_path()));
}

void testRefusesExistingDestination() {
    TempDir temp("tagmv_mover_exists");
    const auto source = temp.path() / "a.txt";
    const auto dest = temp.path() / "b.txt";
    writeFile(source, "a");
    writeFile(dest, "b");

    const MoveResult result = FileMover{}.executeMove(makeMove(source, dest));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::DestinationExists);
    assert(result.error().message.find("already exists") != std::string::npos);
    assert(readFile(source) == "a");
    assert(readFile(dest) == "b");
}

void testRefusesUnresolvedConflict() {
    TempDir temp("tagmv_mover_unresolved");
    const auto source = temp.path() / "a.txt";
    writeFile(source, "a");

    PlannedMove planned = makeMove(source, temp.path() / "out" / "a (3).txt");
    planned.conflictUnresolved = true;
    const MoveResult result = FileMover{}.executeMove(planned);
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::ConflictUnresolved);
    assert(fs::exists(source));
    assert(!fs::exists(temp.path() / "out"));
}

void testMissingSourceIsReported() {
    TempDir temp("tagmv_mover_missing");
    const MoveResult result = FileMover{}.executeMove(makeMove(temp.path() / "gone.mp3", temp.path() / "f" / "gone.mp3"));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::NotFound);
    assert(result.error().source == temp.path() / "gone.mp3");
}

void testCrossDeviceFallback() {
    TempDir temp("tagmv_mover_xdev");
    const auto source = temp.path() / "in" / "track.flac";
    const auto dest = temp.path() / "A - B" / "01 - T.flac";
    writeFile(source, std::string(4096, 'x'));

    const MoveResult result = FileMover(crossDeviceRename()).executeMove(makeMove(source, dest));
    assert(result.ok());
    assert(!fs::exists(source));
    assert(readFile(dest) == std::string(4096, 'x'));
}

void testShortCopyKeepsSource() {
    TempDir temp("tagmv_mover_short");
    const auto source = temp.path() / "in" / "track.flac";
    const auto dest = temp.path() / "A - B" / "01 - T.flac";
    writeFile(source, "0123456789");

    MoveHooks hooks = crossDeviceRename();
    hooks.copy = [](const fs::path&, const fs::path& to, std::error_code&) -> std::uintmax_t {
        writeFile(to, "01234");
        return 5;
    };

    const MoveResult result = FileMover(hooks).executeMove(makeMove(source, dest));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::CopyVerificationFailed);
    assert(readFile(source) == "0123456789");
    assert(!fs::exists(dest));
}

void testFailedCopyKeepsSource() {
    TempDir temp("tagmv_mover_copyfail");
    const auto source = temp.path() / "in" / "track.flac";
    const auto dest = temp.path() / "A - B" / "01 - T.flac";
    writeFile(source, "payload");

    MoveHooks hooks = crossDeviceRename();
    hooks.copy = [](const fs::path&, const fs::path& to, std::error_code& ec) -> std::uintmax_t {
        writeFile(to, "pay");
        ec = std::make_error_code(std::errc::no_space_on_device);
        return 0;
    };

    const MoveResult result = FileMover(hooks).executeMove(makeMove(source, dest));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::Io);
    assert(result.error().code == std::errc::no_space_on_device);
    assert(readFile(source) == "payload");
    assert(!fs::exists(dest));
}

void testSourceRemovalFailureKeepsBothCopies() {
    TempDir temp("tagmv_mover_keepboth");
    const auto source = temp.path() / "in" / "track.flac";
    const auto dest = temp.path() / "A - B" / "01 - T.flac";
    writeFile(source, "payload");

    MoveHooks hooks = crossDeviceRename();
    hooks.removeSource = [](const fs::path&, std::error_code& ec) {
        ec = std::make_error_code(std::errc::permission_denied);
    };

    const MoveResult result = FileMover(hooks).executeMove(makeMove(source, dest));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::PermissionDenied);
    assert(result.error().message.find("failed to remove original") != std::string::npos);
    assert(readFile(source) == "payload");
    assert(readFile(dest) == "payload");
}

void testOtherRenameFailureHasNoFallback() {
    TempDir temp("tagmv_mover_denied");
    const auto source = temp.path() / "a.mp3";
    const auto dest = temp.path() / "f" / "a.mp3";
    writeFile(source, "a");

    MoveHooks hooks;
    hooks.rename = [](const fs::path&, const fs::path&, std::error_code& ec) {
        ec = std::make_error_code(std::errc::permission_denied);
    };
    bool copyCalled = false;
    hooks.copy = [&copyCalled](const fs::path&, const fs::path&, std::error_code&) -> std::uintmax_t {
        copyCalled = true;
        return 0;
    };

    const MoveResult result = FileMover(hooks).executeMove(makeMove(source, dest));
    assert(!result.ok());
    assert(result.error().kind == MoveErrorKind::PermissionDenied);
    assert(result.error().destination == dest);
    assert(result.error().message.find(source.string()) != std::string::npos);
    assert(!copyCalled);
    assert(fs::exists(source));
}

void testClassifyIoError() {
    assert(classifyIoError(std::make_error_code(std::errc::cross_device_link)) == MoveErrorKind::CrossDevice);
    assert(classifyIoError(std::make_error_code(std::errc::permission_denied)) == MoveErrorKind::PermissionDenied);
    assert(classifyIoError(std::make_error_code(std::errc::operation_not_permitted)) == MoveErrorKind::PermissionDenied);
    assert(classifyIoError(std::make_error_code(std::errc::no_such_file_or_directory)) == MoveErrorKind::NotFound);
    assert(classifyIoError(std::make_error_code(std::errc::io_error)) == MoveErrorKind::Io);
}

} // namespace

int main() {
    testCreatesDirectoriesAndMoves();
    testNoOpTouchesNothing();
    testRefusesExistingDestination();
    testRefusesUnresolvedConflict();
    testMissingSourceIsReported();
    testCrossDeviceFallback();
    testShortCopyKeepsSource();
    testFailedCopyKeepsSource();
    testSourceRemovalFailureKeepsBothCopies();
    testOtherRenameFailureHasNoFallback();
    testClassifyIoError();

    std::cout << "file mover tests ok\n";
    return 0;
}
