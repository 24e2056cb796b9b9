#include "../include/account/alias_cache.hpp"
#include "../include/logging/async_logger.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace rolldesk;
using namespace rolldesk::account;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

logging::AsyncLogger g_logger;

// Unique path under /tmp; the file itself is not created
std::string temp_path() {
    char path[] = "/tmp/rolldesk_aliases_XXXXXX";
    int fd = mkstemp(path);
    assert(fd >= 0);
    close(fd);
    std::remove(path);
    return path;
}

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

// ============================================================================
// AccountAliasCache
// ============================================================================

TEST(set_and_get) {
    AccountAliasCache cache;
    ASSERT_FALSE(cache.get("U1234567").has_value());

    cache.set("U1234567", "Main");
    cache.set("U7654321", "");
    ASSERT_EQ(cache.get("U1234567").value(), "Main");
    ASSERT_FALSE(cache.get("U7654321").has_value());
    ASSERT_EQ(cache.size(), 1u);
}

TEST(get_many_skips_unknown) {
    AccountAliasCache cache;
    cache.set_many({{"U1", "Main"}, {"U2", "IRA"}, {"U3", ""}});

    auto some = cache.get_many({"U2", "U9"});
    ASSERT_EQ(some.size(), 1u);
    ASSERT_EQ(some["U2"], "IRA");
    ASSERT_EQ(cache.get_all().size(), 2u);
}

TEST(clear_forgets_session) {
    AccountAliasCache cache;
    cache.set("U1", "Main");
    cache.clear();
    ASSERT_EQ(cache.size(), 0u);
    ASSERT_FALSE(cache.get("U1").has_value());
}

// ============================================================================
// AliasStore
// ============================================================================

TEST(missing_file_loads_empty) {
    AliasStore store(temp_path(), g_logger);
    ASSERT_TRUE(store.load().empty());
}

TEST(save_merges_with_disk) {
    std::string path = temp_path();
    AliasStore store(path, g_logger);

    ASSERT_TRUE(store.save({{"U1", "Main"}, {"U2", "IRA"}}));
    ASSERT_TRUE(store.save({{"U2", "Roth"}, {"U3", "Kids"}}));

    auto loaded = store.load();
    ASSERT_EQ(loaded.size(), 3u);
    ASSERT_EQ(loaded["U1"], "Main");
    ASSERT_EQ(loaded["U2"], "Roth");
    ASSERT_EQ(loaded["U3"], "Kids");

    // A second store on the same path sees the same data
    ASSERT_EQ(AliasStore(path, g_logger).load(), loaded);
    std::remove(path.c_str());
}

TEST(corrupt_file_loads_empty) {
    std::string path = temp_path();
    write_file(path, "{ \"U1\": ");
    ASSERT_TRUE(AliasStore(path, g_logger).load().empty());

    write_file(path, "[\"U1\", \"Main\"]");
    ASSERT_TRUE(AliasStore(path, g_logger).load().empty());

    // Non-string values are skipped
    write_file(path, R"({"U1": "Main", "U2": 42})");
    auto loaded = AliasStore(path, g_logger).load();
    ASSERT_EQ(loaded.size(), 1u);
    ASSERT_EQ(loaded["U1"], "Main");
    std::remove(path.c_str());
}

TEST(unwritable_path_reports_failure) {
    AliasStore store("/nonexistent-dir/aliases.json", g_logger);
    ASSERT_FALSE(store.save({{"U1", "Main"}}));
}

int main() {
    std::cout << "\n=== Account Alias Tests ===\n\n";

    std::cout << "AccountAliasCache:\n";
    RUN_TEST(set_and_get);
    RUN_TEST(get_many_skips_unknown);
    RUN_TEST(clear_forgets_session);

    std::cout << "\nAliasStore:\n";
    RUN_TEST(missing_file_loads_empty);
    RUN_TEST(save_merges_with_disk);
    RUN_TEST(corrupt_file_loads_empty);
    RUN_TEST(unwritable_path_reports_failure);

    std::cout << "\n=== All Account Alias Tests Passed! ===\n";
    return 0;
}
