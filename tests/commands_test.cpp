#include "../server/commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// Records output; pretends to be connected without a real socket
class RecordingEnvironment : public Environment {
public:
    explicit RecordingEnvironment(fs::path cwd) : cwd_(std::move(cwd)) {}

    void writeln(const std::string& text) override { lines.push_back(text); }
    void write(const char* chars, size_t offset, size_t len) override {
        lines.push_back(std::string(chars + offset, len));
    }
    fs::path current_path() const override { return cwd_; }
    void set_current_path(const fs::path& path) override { cwd_ = path; }
    bool is_connected() const override { return true; }
    Connection* connection() override { return nullptr; }

    std::vector<std::string> lines;

private:
    fs::path cwd_;
};

static fs::path make_tree() {
    fs::path root = fs::temp_directory_path() / "rshell_commands_test";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "sub");
    std::ofstream(root / "b.txt") << "b";
    std::ofstream(root / "a.txt") << "a";
    return fs::canonical(root);
}

static bool test_pwd_cd_ls() {
    fs::path root = make_tree();
    CommandDispatcher d;
    RecordingEnvironment env(root);

    d.dispatch(env, "pwd");
    TEST_ASSERT(env.lines.size() == 1 && env.lines[0] == root.string(), "pwd wrong");

    env.lines.clear();
    d.dispatch(env, "ls");
    std::vector<std::string> expect = {"a.txt", "b.txt", "sub/"};
    TEST_ASSERT(env.lines == expect, "ls listing wrong");

    d.dispatch(env, "cd sub");
    TEST_ASSERT(env.current_path() == root / "sub", "cd relative failed: " << env.current_path());
    d.dispatch(env, "cd ..");
    TEST_ASSERT(env.current_path() == root, "cd .. failed: " << env.current_path());

    env.lines.clear();
    d.dispatch(env, "cd missing");
    TEST_ASSERT(env.current_path() == root, "cd into missing dir moved");
    TEST_ASSERT(env.lines.size() == 1, "no error for missing dir");
    return true;
}

static bool test_unknown_and_blank() {
    CommandDispatcher d;
    RecordingEnvironment env(fs::temp_directory_path());

    CommandResult r = d.dispatch(env, "   ");
    TEST_ASSERT(env.lines.empty(), "blank line produced output");
    TEST_ASSERT(r.status == CommandResult::Status::CONTINUE, "blank line ended session");

    d.dispatch(env, "frobnicate now");
    TEST_ASSERT(env.lines.size() == 1 && env.lines[0] == "Unknown command: frobnicate",
                "unknown command message wrong");
    return true;
}

static bool test_transfer_requests() {
    fs::path root = make_tree();
    CommandDispatcher d;
    RecordingEnvironment env(root);

    CommandResult r = d.dispatch(env, "download a.txt");
    TEST_ASSERT(r.transfer.has_value(), "download did not request a transfer");
    TEST_ASSERT(r.transfer->direction == TransferDirection::DOWNLOAD, "wrong direction");
    TEST_ASSERT(r.transfer->path == (root / "a.txt").string(), "download path not resolved");

    r = d.dispatch(env, "download sub");
    TEST_ASSERT(r.transfer && r.transfer->path == (root / "sub").string(),
                "directory download not requested");

    env.lines.clear();
    r = d.dispatch(env, "download nothing.bin");
    TEST_ASSERT(!r.transfer.has_value(), "download of missing file requested");
    TEST_ASSERT(env.lines.size() == 1 &&
                env.lines[0].rfind("No such file or directory: ", 0) == 0,
                "missing download message wrong");

    r = d.dispatch(env, "upload \"/tmp/my file.txt\"");
    TEST_ASSERT(r.transfer && r.transfer->direction == TransferDirection::UPLOAD, "upload missing");
    TEST_ASSERT(r.transfer->path == "/tmp/my file.txt", "quoted path split: " << r.transfer->path);
    TEST_ASSERT(r.transfer->overwrite == OverwritePolicy::REFUSE, "upload overwrites by default");

    r = d.dispatch(env, "upload -o x.bin");
    TEST_ASSERT(r.transfer && r.transfer->overwrite == OverwritePolicy::OVERWRITE, "-o ignored");

    CommandDispatcher permissive(OverwritePolicy::OVERWRITE);
    r = permissive.dispatch(env, "upload x.bin");
    TEST_ASSERT(r.transfer && r.transfer->overwrite == OverwritePolicy::OVERWRITE,
                "host overwrite default ignored");
    return true;
}

static bool test_exit_terminates() {
    CommandDispatcher d;
    RecordingEnvironment env(fs::temp_directory_path());
    CommandResult r = d.dispatch(env, "EXIT");
    TEST_ASSERT(r.status == CommandResult::Status::TERMINATE, "exit did not terminate");
    return true;
}

static bool test_tokenize_rejects_open_quote() {
    bool threw = false;
    try {
        CommandDispatcher::tokenize("upload \"half");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "unterminated quote accepted");
    return true;
}

int main() {
    std::cout << "--- Command dispatcher tests ---" << std::endl;

    if (test_pwd_cd_ls())                  std::cout << "PASS: pwd/cd/ls" << std::endl;
    if (test_unknown_and_blank())          std::cout << "PASS: unknown and blank" << std::endl;
    if (test_transfer_requests())          std::cout << "PASS: transfer requests" << std::endl;
    if (test_exit_terminates())            std::cout << "PASS: exit" << std::endl;
    if (test_tokenize_rejects_open_quote()) std::cout << "PASS: tokenizer" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
