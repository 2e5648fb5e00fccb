// unit_profile_store.cpp - profile validation, persistence and locking
#include "profile_store.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <unistd.h>

static ServerProfile staging(){
    return ServerProfile{.alias="staging", .host="1.2.3.4", .user="dev", .port=2222, .keyPath="/home/u/.ssh/id"};
}

static void test_validation(){
    assert(validateProfile(staging()));
    ServerProfile p = staging();
    p.alias = ""; assert(validateProfile(p).error().kind == ErrorKind::InvalidProfile);
    p.alias = "my server"; assert(!validateProfile(p));
    p.alias = "a:b"; assert(!validateProfile(p));
    p.alias = "-oProxy"; assert(!validateProfile(p));
    p = staging(); p.host = ""; assert(!validateProfile(p));
    p = staging(); p.host = "-oProxyCommand=x"; assert(!validateProfile(p));
    p = staging(); p.port = 0; assert(!validateProfile(p));
    p = staging(); p.port = 65536; assert(!validateProfile(p));
    p = staging(); p.port = 65535; assert(validateProfile(p));
    p = staging(); p.port.reset(); p.user.reset(); p.keyPath.reset(); assert(validateProfile(p));
    p = staging(); p.defaultRemotePath = "relative/dir"; assert(!validateProfile(p));

    assert(parsePort("2222").value() == 2222);
    assert(parsePort("22x").error().kind == ErrorKind::InvalidProfile);
    assert(!parsePort("0"));
    assert(!parsePort(""));
}

static void test_missing_file_is_empty(){
    auto dir = make_temp_dir("store_missing");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.empty());
    assert(!store.defaultAlias());
}

static void test_add_then_get(){
    auto dir = make_temp_dir("store_add");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(staging()));
    auto got = store.get("staging");
    assert(got);
    assert(**got == staging());
    assert(fs::exists(dir/"servers.json"));
    assert(store.get("prod").error().kind == ErrorKind::UnknownAlias);
}

static void test_round_trip_keeps_order(){
    auto dir = make_temp_dir("store_roundtrip");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    ServerProfile zeta{.alias="zeta", .host="z.example.com"};
    ServerProfile alpha{.alias="alpha", .host="10.0.0.1", .user="ops", .defaultRemotePath="/srv/app"};
    assert(store.add(zeta));
    assert(store.add(staging()));
    assert(store.add(alpha));
    assert(store.setDefault("staging"));

    ProfileStore reloaded(dir/"servers.json");
    assert(reloaded.load());
    auto profiles = reloaded.list();
    assert(profiles.size() == 3);
    assert(profiles[0] == zeta);
    assert(profiles[1] == staging());
    assert(profiles[2] == alpha);
    assert(reloaded.defaultAlias() == std::optional<std::string>("staging"));

    // The view can be walked more than once.
    size_t first = 0, second = 0;
    for (const auto& p : reloaded.list()) { (void)p; ++first; }
    for (const auto& p : reloaded.list()) { (void)p; ++second; }
    assert(first == 3 && second == 3);

    // Saving an unchanged store reproduces the same collection.
    assert(reloaded.save());
    ProfileStore again(dir/"servers.json");
    assert(again.load());
    assert(std::equal(again.list().begin(), again.list().end(), profiles.begin(), profiles.end()));
}

static void test_duplicate_alias_leaves_store_unchanged(){
    auto dir = make_temp_dir("store_dup");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(staging()));
    std::string before = read_file(dir/"servers.json");

    ServerProfile other{.alias="staging", .host="5.6.7.8"};
    auto result = store.add(other);
    assert(!result && result.error().kind == ErrorKind::DuplicateAlias);
    assert(store.list().size() == 1);
    assert(**store.get("staging") == staging());
    assert(read_file(dir/"servers.json") == before);
}

static void test_invalid_profile_is_not_added(){
    auto dir = make_temp_dir("store_invalid");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    ServerProfile bad{.alias="bad", .host="h", .port=70000};
    assert(store.add(bad).error().kind == ErrorKind::InvalidProfile);
    assert(store.empty());
    assert(!fs::exists(dir/"servers.json"));
}

static void test_remove(){
    auto dir = make_temp_dir("store_remove");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(staging()));
    assert(store.add(ServerProfile{.alias="prod", .host="prod.example.com"}));
    assert(store.setDefault("staging"));
    std::string before = read_file(dir/"servers.json");

    auto unknown = store.remove("nope");
    assert(!unknown && unknown.error().kind == ErrorKind::UnknownAlias);
    assert(store.list().size() == 2);
    assert(read_file(dir/"servers.json") == before);

    assert(store.remove("staging"));
    assert(store.list().size() == 1);
    assert(!store.defaultAlias());
    ProfileStore reloaded(dir/"servers.json");
    assert(reloaded.load());
    assert(reloaded.list().size() == 1 && reloaded.list()[0].alias == "prod");
    assert(!reloaded.defaultAlias());
}

static void test_replace(){
    auto dir = make_temp_dir("store_replace");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(staging()));
    ServerProfile moved = staging(); moved.host = "4.3.2.1"; moved.port.reset();
    assert(store.replace(moved));
    assert(**store.get("staging") == moved);
    ServerProfile ghost{.alias="ghost", .host="h"};
    assert(store.replace(ghost).error().kind == ErrorKind::UnknownAlias);
    assert(store.setDefault("ghost").error().kind == ErrorKind::UnknownAlias);
}

static void test_add_as_default(){
    auto dir = make_temp_dir("store_add_default");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(ServerProfile{.alias="prod", .host="prod.example.com"}, true));
    assert(store.add(staging(), true));
    assert(store.defaultAlias() == std::optional<std::string>("staging"));

    ProfileStore reloaded(dir/"servers.json");
    assert(reloaded.load());
    assert(reloaded.defaultAlias() == std::optional<std::string>("staging"));

    // A rejected add changes neither the collection nor the default.
    std::string before = read_file(dir/"servers.json");
    ServerProfile clash{.alias="prod", .host="other.example.com"};
    assert(store.add(clash, true).error().kind == ErrorKind::DuplicateAlias);
    ServerProfile bad{.alias="bad", .host="h", .port=0};
    assert(store.add(bad, true).error().kind == ErrorKind::InvalidProfile);
    assert(store.defaultAlias() == std::optional<std::string>("staging"));
    assert(store.list().size() == 2);
    assert(read_file(dir/"servers.json") == before);

    // A save failure rolls back both the new profile and the default.
    fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec);
    bool writable = ::access(dir.c_str(), W_OK) == 0;
    if (!writable) {
        auto failed = store.add(ServerProfile{.alias="late", .host="h"}, true);
        assert(!failed && failed.error().kind == ErrorKind::StoreUnavailable);
        assert(store.defaultAlias() == std::optional<std::string>("staging"));
        assert(!store.get("late"));
    }
    fs::permissions(dir, fs::perms::owner_all);
}

static void test_corrupt_store(){
    auto dir = make_temp_dir("store_corrupt");
    write_file(dir/"servers.json", "{ \"servers\": [ {\"alias\": \"a\", ");
    ProfileStore store(dir/"servers.json");
    auto loaded = store.load();
    assert(!loaded && loaded.error().kind == ErrorKind::StoreCorrupt);

    // A failed mutation never rewrites the unreadable file.
    std::string before = read_file(dir/"servers.json");
    assert(store.add(staging()).error().kind == ErrorKind::StoreCorrupt);
    assert(read_file(dir/"servers.json") == before);

    write_file(dir/"servers.json",
        "{\"servers\": [{\"alias\": \"a\", \"host\": \"h1\"}, {\"alias\": \"a\", \"host\": \"h2\"}]}");
    assert(store.load().error().kind == ErrorKind::StoreCorrupt);

    write_file(dir/"servers.json", "{\"servers\": [{\"alias\": \"a\", \"host\": \"h\", \"port\": 99999}]}");
    assert(store.load().error().kind == ErrorKind::StoreCorrupt);

    write_file(dir/"servers.json", "{\"servers\": [{\"alias\": \"a\", \"host\": \"h\", \"port\": \"22\"}]}");
    assert(store.load().error().kind == ErrorKind::StoreCorrupt);

    write_file(dir/"servers.json", "{\"default_server\": \"b\", \"servers\": [{\"alias\": \"a\", \"host\": \"h\"}]}");
    assert(store.load().error().kind == ErrorKind::StoreCorrupt);

    write_file(dir/"servers.json", "[1, 2]");
    assert(store.load().error().kind == ErrorKind::StoreCorrupt);
}

static void test_hand_edited_store(){
    auto dir = make_temp_dir("store_hand");
    write_file(dir/"servers.json",
        "{\n"
        "  \"servers\": [\n"
        "    { \"alias\": \"web\", \"host\": \"web.example.com\", \"user\": \"deploy\" }\n"
        "  ]\n"
        "}\n");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    auto web = store.get("web");
    assert(web && (*web)->user == std::optional<std::string>("deploy"));
    assert(!(*web)->port);
}

static void test_concurrent_writers_keep_both_updates(){
    auto dir = make_temp_dir("store_concurrent");
    ProfileStore first(dir/"servers.json");
    ProfileStore second(dir/"servers.json");
    assert(first.load());
    assert(second.load());

    // Each store mutates from a stale in-memory view; the re-read under the lock keeps both.
    assert(first.add(ServerProfile{.alias="one", .host="h1"}));
    assert(second.add(ServerProfile{.alias="two", .host="h2"}));
    assert(second.list().size() == 2);

    ProfileStore reloaded(dir/"servers.json");
    assert(reloaded.load());
    assert(reloaded.list().size() == 2);
    assert(reloaded.list()[0].alias == "one" && reloaded.list()[1].alias == "two");
    assert(fs::exists(dir/"servers.json.lock"));

    // No temporary file survives a save.
    for (auto& e : fs::directory_iterator(dir)) {
        assert(e.path().filename().string().find(".tmp") == std::string::npos);
    }
}

static void test_lock_is_released(){
    auto dir = make_temp_dir("store_lock");
    {
        auto lock = StoreLock::acquire(dir/"servers.json.lock");
        assert(lock);
    }
    // Would block forever if the first guard had leaked its lock.
    auto again = StoreLock::acquire(dir/"servers.json.lock");
    assert(again);
}

int main(){
    test_validation();
    test_missing_file_is_empty();
    test_add_then_get();
    test_round_trip_keeps_order();
    test_duplicate_alias_leaves_store_unchanged();
    test_invalid_profile_is_not_added();
    test_remove();
    test_replace();
    test_add_as_default();
    test_corrupt_store();
    test_hand_edited_store();
    test_concurrent_writers_keep_both_updates();
    test_lock_is_released();
    std::cout << "Profile store tests passed" << std::endl;
    return 0;
}
