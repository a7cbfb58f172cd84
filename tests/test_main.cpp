#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_report_mutex;
} // namespace

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        if (!verbose()) {
            return;
        }
        std::lock_guard<std::mutex> lock(g_report_mutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
        if (!verbose()) {
            return;
        }
        std::lock_guard<std::mutex> lock(g_report_mutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }

private:
    // QUICKDROP_TEST_VERBOSE=1 prints each test and subcase as it starts.
    static bool verbose() {
        static bool const enabled = [] {
            const char* value = std::getenv("QUICKDROP_TEST_VERBOSE");
            return value != nullptr && std::strcmp(value, "0") != 0;
        }();
        return enabled;
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    doctest::Context context;

    // Apply command line arguments
    context.applyCommandLine(argc, argv);

    return context.run();
}
