#include <gtest/gtest.h>

#include "remotix/HostKeyVerifier.hpp"
#include "remotix/KeyscanFetcher.hpp"

#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

using namespace remotix;

namespace {

// Writes an executable shell script standing in for ssh-keyscan.
std::string fakeKeyscan(const QTemporaryDir& dir, const QString& name, const QByteArray& body) {
    const QString path = dir.filePath(name);
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) return {};
    f.write("#!/bin/sh\n" + body);
    f.close();
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path.toStdString();
}

} // namespace

TEST(keyscan_fetcher, passes_port_timeout_and_host) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const std::string prog = fakeKeyscan(dir, "keyscan-ok",
        "echo \"# $*\"\n"
        "echo \"$6 ssh-ed25519 cmVtb3RpeC1ob3N0LWtleS1h\"\n");
    FetchTimeouts t;
    t.attemptSeconds = 3;
    KeyscanFetcher fetcher(prog, t);

    std::string out, err;
    ASSERT_TRUE(fetcher.fetch("example.test", 2222, out, err)) << err;
    EXPECT_NE(out.find("# -p 2222 -T 3 -- example.test"), std::string::npos) << out;
    EXPECT_NE(out.find("example.test ssh-ed25519 "), std::string::npos) << out;
}

TEST(keyscan_fetcher, dash_host_is_not_read_as_an_option) {
    QTemporaryDir dir;
    const std::string prog = fakeKeyscan(dir, "keyscan-args",
        "for a in \"$@\"; do echo \"arg:$a\"; done\n");
    KeyscanFetcher fetcher(prog);

    std::string out, err;
    ASSERT_TRUE(fetcher.fetch("-f/etc/hosts", 22, out, err)) << err;
    EXPECT_NE(out.find("arg:--\narg:-f/etc/hosts\n"), std::string::npos) << out;
}

TEST(keyscan_fetcher, hung_process_is_killed_at_overall_timeout) {
    QTemporaryDir dir;
    const std::string prog = fakeKeyscan(dir, "keyscan-hang", "exec sleep 30\n");
    FetchTimeouts t;
    t.overallMs = 300;
    KeyscanFetcher fetcher(prog, t);

    QElapsedTimer timer;
    timer.start();
    std::string out, err;
    EXPECT_FALSE(fetcher.fetch("example.test", 22, out, err));
    EXPECT_EQ(err, "Timeout fetching host key");
    EXPECT_LT(timer.elapsed(), 5000);
}

TEST(keyscan_fetcher, nonzero_exit_is_failure) {
    QTemporaryDir dir;
    const std::string prog = fakeKeyscan(dir, "keyscan-fail",
        "echo \"example.test ssh-rsa AAAA\"\n"
        "echo \"connection refused\" >&2\n"
        "exit 1\n");
    KeyscanFetcher fetcher(prog);
    std::string out, err;
    EXPECT_FALSE(fetcher.fetch("example.test", 22, out, err));
    EXPECT_NE(err.find("code 1"), std::string::npos) << err;
    EXPECT_NE(err.find("connection refused"), std::string::npos) << err;
}

TEST(keyscan_fetcher, empty_output_is_failure) {
    QTemporaryDir dir;
    const std::string prog = fakeKeyscan(dir, "keyscan-empty", "exit 0\n");
    KeyscanFetcher fetcher(prog);
    std::string out, err;
    EXPECT_FALSE(fetcher.fetch("example.test", 22, out, err));
    EXPECT_NE(err.find("unreachable"), std::string::npos) << err;
}

TEST(keyscan_fetcher, missing_program_is_failure) {
    KeyscanFetcher fetcher("/nonexistent/ssh-keyscan");
    std::string out, err;
    EXPECT_FALSE(fetcher.fetch("example.test", 22, out, err));
    EXPECT_FALSE(err.empty());
}

TEST(keyscan_fetcher, drives_verifier_end_to_end) {
    QTemporaryDir dir;
    const std::string prog = fakeKeyscan(dir, "keyscan-multi",
        "echo \"# $6:$2 SSH-2.0-OpenSSH_9.6\"\n"
        "echo \"$6 ssh-rsa YWJj\"\n"
        "echo \"$6 ecdsa-sha2-nistp256 YWJj\"\n"
        "echo \"$6 ssh-ed25519 cmVtb3RpeC1ob3N0LWtleS1h\"\n");
    TrustStore store(dir.filePath("store").toStdString());
    HostKeyVerifier verifier(std::make_unique<KeyscanFetcher>(prog), store);

    const FingerprintResult r = verifier.verify("example.test", 22);
    ASSERT_EQ(r.status, FingerprintResult::Status::New) << r.error;
    EXPECT_EQ(r.keyType, "ssh-ed25519");
    EXPECT_EQ(r.fingerprint, "SHA256:fQWqmOJL8jmRhfORDWl3YhF6nqecijI9ohnvXi/2ty0");
    ASSERT_TRUE(verifier.commit("example.test", 22, r.keyType, r.fingerprint, r.fullKey));
    EXPECT_EQ(verifier.verify("example.test", 22).status, FingerprintResult::Status::Match);
}
