// unit_command_builder.cpp - argument vectors for scp, rsync and ssh
#include "command_builder.hpp"
#include "target_resolver.hpp"
#include "test_helpers.hpp"
#include <cassert>
#include <iostream>

static const ServerProfile kStaging{.alias="staging", .host="1.2.3.4", .user="dev", .port=2222, .keyPath="/home/u/.ssh/id"};

static Endpoint remote(const std::string& path, const ServerProfile& profile = kStaging){
    return Endpoint{true, &profile, path};
}
static Endpoint local(const std::string& path){
    return Endpoint{false, nullptr, path};
}

static FakeFileSystem keyed_fs(){
    FakeFileSystem fsys;
    fsys.files.insert("/home/u/.ssh/id");
    fsys.files.insert("file.txt");
    fsys.files.insert("a b.txt");
    fsys.dirs.insert("site");
    return fsys;
}

static ArgumentVector build_ok(const CommandBuilder& builder, Strategy strategy, const TransferRequest& req){
    auto argv = builder.build(strategy, req);
    assert(argv);
    return *argv;
}

static void test_send_end_to_end(){
    auto dir = make_temp_dir("builder_e2e");
    ProfileStore store(dir/"servers.json");
    assert(store.load());
    assert(store.add(kStaging));
    TargetResolver resolver(store);
    FakeFileSystem fsys = keyed_fs();

    auto src = resolver.resolve("file.txt");
    auto dst = resolver.resolve("staging:/var/www/");
    assert(src && dst);
    auto req = makeTransferRequest(*src, *dst, false, fsys);
    auto strategy = selectStrategy(req);
    assert(strategy && *strategy == Strategy::SingleFileCopy);

    CommandBuilder builder(fsys, "local");
    auto argv = build_ok(builder, *strategy, req);
    ArgumentVector expected{"scp", "-P", "2222", "-i", "/home/u/.ssh/id", "--", "file.txt", "dev@1.2.3.4:/var/www/"};
    assert(argv == expected);
}

static void test_space_stays_one_argument(){
    FakeFileSystem fsys = keyed_fs();
    CommandBuilder builder(fsys, "local");
    auto argv = build_ok(builder, Strategy::SingleFileCopy,
        makeTransferRequest(local("a b.txt"), remote("/tmp/"), false, fsys));
    assert(contains(argv, "a b.txt"));
    assert(argv.back() == "dev@1.2.3.4:/tmp/");
}

static void test_missing_key_is_invalid_profile(){
    FakeFileSystem fsys;
    fsys.files.insert("file.txt");
    CommandBuilder builder(fsys, "local");
    auto argv = builder.build(Strategy::SingleFileCopy,
        makeTransferRequest(local("file.txt"), remote("/tmp/"), false, fsys));
    assert(!argv && argv.error().kind == ErrorKind::InvalidProfile);
    assert(argv.error().message.find("/home/u/.ssh/id") != std::string::npos);
}

static void test_directory_sync(){
    FakeFileSystem fsys = keyed_fs();
    CommandBuilder builder(fsys, "local");
    auto argv = build_ok(builder, Strategy::DirectorySync,
        makeTransferRequest(local("site"), remote("/var/www"), false, fsys));
    ArgumentVector expected{"rsync", "-avz", "--progress", "--protect-args",
                            "-e", "ssh -p 2222 -i /home/u/.ssh/id", "--", "site/", "dev@1.2.3.4:/var/www"};
    assert(argv == expected);

    // Pulls keep the remote source as given.
    auto pull = build_ok(builder, Strategy::DirectorySync,
        makeTransferRequest(remote("/var/log"), local("logs"), true, fsys));
    assert(pull[pull.size() - 2] == "dev@1.2.3.4:/var/log");
    assert(pull.back() == "logs");

    // Key paths with spaces are quoted inside the -e value.
    ServerProfile spaced{.alias="spaced", .host="h", .user="u", .keyPath="/keys/my key"};
    fsys.files.insert("/keys/my key");
    auto quoted = build_ok(builder, Strategy::DirectorySync,
        makeTransferRequest(local("site"), remote("/x", spaced), false, fsys));
    assert(quoted[value_after(quoted, "-e")] == "ssh -i '/keys/my key'");

    ServerProfile hostile{.alias="hostile", .host="h", .keyPath="/keys/a'b\"c"};
    fsys.files.insert("/keys/a'b\"c");
    auto rejected = builder.build(Strategy::DirectorySync,
        makeTransferRequest(local("site"), remote("/x", hostile), false, fsys));
    assert(!rejected && rejected.error().kind == ErrorKind::InvalidProfile);

    // No -e at all when neither port nor key is set.
    ServerProfile bare{.alias="bare", .host="h", .user="u"};
    auto plain = build_ok(builder, Strategy::DirectorySync,
        makeTransferRequest(local("site"), remote("/x", bare), false, fsys));
    assert(!contains(plain, "-e"));
}

static void test_remote_list(){
    FakeFileSystem fsys = keyed_fs();
    CommandBuilder builder(fsys, "local");
    auto argv = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("/var/www/my site"), std::nullopt, false, fsys));
    ArgumentVector expected{"ssh", "-p", "2222", "-i", "/home/u/.ssh/id", "--", "dev@1.2.3.4",
                            "ls", "-la", "--", "'/var/www/my site'"};
    assert(argv == expected);

    auto home = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote(""), std::nullopt, false, fsys));
    assert(home.back() == "--");

    auto injected = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("/tmp; rm -rf ~"), std::nullopt, false, fsys));
    assert(injected.back() == "'/tmp; rm -rf ~'");

    // Home-relative paths keep the tilde where the remote shell can expand it.
    auto homeLogs = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("~/logs"), std::nullopt, false, fsys));
    assert(homeLogs.back() == "~/'logs'");
    auto homeSpaced = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("~/my logs; id"), std::nullopt, false, fsys));
    assert(homeSpaced.back() == "~/'my logs; id'");
    auto bareTilde = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("~"), std::nullopt, false, fsys));
    assert(bareTilde.back() == "~");
    auto otherUser = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("~root/x"), std::nullopt, false, fsys));
    assert(otherUser.back() == "'~root/x'");

    // The words ssh hands over must still run as a plain listing under a POSIX shell.
    auto dir = make_temp_dir("builder_tilde_home");
    write_file(dir/"logs"/"today.log", "x");
    PosixProcessRunner runner;
    std::string remoteCommand;
    for (size_t i = value_after(homeLogs, "dev@1.2.3.4"); i < homeLogs.size(); ++i) {
        remoteCommand += (remoteCommand.empty() ? "" : " ") + homeLogs[i];
    }
    auto listed = runner.run({"env", "HOME=" + fs::absolute(dir).string(), "sh", "-c", remoteCommand});
    assert(listed && listed->exitCode == 0);
}

static void test_option_like_paths_follow_separator(){
    FakeFileSystem fsys = keyed_fs();
    fsys.files.insert("-rf");
    CommandBuilder builder(fsys, "local");
    auto argv = build_ok(builder, Strategy::SingleFileCopy,
        makeTransferRequest(local("-rf"), remote("/tmp/"), false, fsys));
    size_t sep = value_after(argv, "--") - 1;
    size_t operand = 0;
    for (size_t i = 0; i < argv.size(); ++i) if (argv[i] == "-rf") operand = i;
    assert(sep < operand);
}

static void test_default_user_and_ipv6(){
    FakeFileSystem fsys = keyed_fs();
    CommandBuilder builder(fsys, "alice");
    ServerProfile v6{.alias="v6", .host="2001:db8::1"};
    auto argv = build_ok(builder, Strategy::SingleFileCopy,
        makeTransferRequest(local("file.txt"), remote("/tmp/", v6), false, fsys));
    ArgumentVector expected{"scp", "--", "file.txt", "alice@[2001:db8::1]:/tmp/"};
    assert(argv == expected);

    auto listing = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("/", v6), std::nullopt, false, fsys));
    assert(contains(listing, "alice@2001:db8::1"));

    // Bracketed literals are bracketed once for scp and stripped for ssh.
    ServerProfile bracketed{.alias="v6b", .host="[2001:db8::1]", .user="u"};
    assert(validateProfile(bracketed));
    auto copy = build_ok(builder, Strategy::SingleFileCopy,
        makeTransferRequest(local("file.txt"), remote("/tmp/", bracketed), false, fsys));
    assert(copy.back() == "u@[2001:db8::1]:/tmp/");
    auto bracketedListing = build_ok(builder, Strategy::RemoteList,
        makeTransferRequest(remote("/", bracketed), std::nullopt, false, fsys));
    assert(contains(bracketedListing, "u@2001:db8::1"));
    assert(!contains(bracketedListing, "u@[2001:db8::1]"));
}

static void test_missing_destination(){
    FakeFileSystem fsys = keyed_fs();
    CommandBuilder builder(fsys, "local");
    auto argv = builder.build(Strategy::SingleFileCopy,
        makeTransferRequest(remote("/etc/hosts"), std::nullopt, false, fsys));
    assert(!argv && argv.error().kind == ErrorKind::InvalidTarget);
    auto none = builder.build(Strategy::SingleFileCopy,
        makeTransferRequest(local("file.txt"), local("b"), false, fsys));
    assert(!none && none.error().kind == ErrorKind::AmbiguousRequest);
}

static void test_render(){
    assert(CommandBuilder::shellQuote("it's") == "'it'\\''s'");
    assert(CommandBuilder::shellQuote("") == "''");
    ArgumentVector argv{"scp", "-P", "22", "--", "a b.txt", "u@h:/tmp/"};
    assert(CommandBuilder::renderCommand(argv) == "scp -P 22 -- 'a b.txt' u@h:/tmp/");
    assert(std::string(CommandBuilder::programFor(Strategy::DirectorySync)) == "rsync");
    assert(std::string(CommandBuilder::programFor(Strategy::SingleFileCopy)) == "scp");
    assert(std::string(CommandBuilder::programFor(Strategy::RemoteList)) == "ssh");
}

int main(){
    test_send_end_to_end();
    test_space_stays_one_argument();
    test_missing_key_is_invalid_profile();
    test_directory_sync();
    test_remote_list();
    test_option_like_paths_follow_separator();
    test_default_user_and_ipv6();
    test_missing_destination();
    test_render();
    std::cout << "Command builder tests passed" << std::endl;
    return 0;
}
