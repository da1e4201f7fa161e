// remotix-hostkey: check, trust or forget SSH host keys from the command line.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include "remotix/HostKeyVerifier.hpp"
#include "remotix/Settings.hpp"
#include "remotix/TrustStore.hpp"

using remotix::FingerprintResult;

namespace {

enum ExitCode { ExitOk = 0, ExitError = 1, ExitNew = 2, ExitChanged = 3 };

int listHosts(const remotix::TrustStore& store, QTextStream& out) {
    const auto all = store.getAll();
    for (const auto& r : all) {
        out << QString::fromStdString(r.identity().key()) << '\t'
            << QString::fromStdString(r.keyType) << '\t'
            << QString::fromStdString(r.fingerprint) << '\t'
            << QString::fromStdString(r.addedAt) << '\n';
    }
    if (all.empty()) out << "No known hosts in " << QString::fromStdString(store.filePath()) << '\n';
    return ExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("Remotix");
    QCoreApplication::setOrganizationName("Remotix");

    QCommandLineParser parser;
    parser.setApplicationDescription("Trust-on-first-use SSH host key verification.");
    parser.addHelpOption();
    parser.addPositionalArgument("host", "Host to verify.");
    QCommandLineOption portOpt({"p", "port"}, "SSH port (default 22).", "port", "22");
    QCommandLineOption trustOpt("trust", "Record the key when the host is new.");
    QCommandLineOption replaceOpt("replace", "With --trust, also replace a changed key.");
    QCommandLineOption forgetOpt("forget", "Remove the stored key for the host.");
    QCommandLineOption listOpt("list", "List all known hosts.");
    QCommandLineOption fetcherOpt("fetcher", "Key source: keyscan or libssh2.", "name");
    QCommandLineOption storeOpt("store", "Directory holding known_hosts.json.", "dir");
    parser.addOptions({portOpt, trustOpt, replaceOpt, forgetOpt, listOpt, fetcherOpt, storeOpt});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    remotix::Settings settings = remotix::Settings::load();
    if (parser.isSet(storeOpt)) settings.storeDir = parser.value(storeOpt).toStdString();
    if (parser.isSet(fetcherOpt) &&
        !remotix::parseFetcherKind(parser.value(fetcherOpt).toStdString(), settings.fetcher)) {
        err << "Unknown fetcher: " << parser.value(fetcherOpt) << '\n';
        return ExitError;
    }

    remotix::TrustStore store(settings.storeDir);
    if (parser.isSet(listOpt)) return listHosts(store, out);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << "Expected exactly one host\n";
        return ExitError;
    }
    bool portOk = false;
    const uint port = parser.value(portOpt).toUInt(&portOk);
    if (!portOk || port == 0 || port > 65535) {
        err << "Invalid port: " << parser.value(portOpt) << '\n';
        return ExitError;
    }
    const auto port16 = static_cast<std::uint16_t>(port);
    const std::string host = args.first().toStdString();

    remotix::HostKeyVerifier verifier(remotix::makeFetcher(settings), store);
    if (parser.isSet(forgetOpt)) {
        if (!verifier.forget(host, port16)) {
            err << "Could not write " << QString::fromStdString(store.filePath()) << '\n';
            return ExitError;
        }
        out << "Forgot " << QString::fromStdString(remotix::HostIdentity::make(host, port16).key()) << '\n';
        return ExitOk;
    }

    const FingerprintResult r = verifier.verify(host, port16);
    if (r.status == FingerprintResult::Status::Error) {
        err << "Error: " << QString::fromStdString(r.error) << '\n';
        return ExitError;
    }
    out << remotix::toString(r.status) << ' ' << QString::fromStdString(r.keyType) << ' '
        << QString::fromStdString(r.fingerprint) << '\n';
    if (r.status == FingerprintResult::Status::Changed) {
        out << "previous " << QString::fromStdString(r.previousFingerprint) << '\n';
    }

    const bool shouldCommit = parser.isSet(trustOpt) &&
        (r.status == FingerprintResult::Status::New ||
         (r.status == FingerprintResult::Status::Changed && parser.isSet(replaceOpt)));
    if (shouldCommit) {
        if (!verifier.commit(host, port16, r.keyType, r.fingerprint, r.fullKey)) {
            err << "Could not write " << QString::fromStdString(store.filePath()) << '\n';
            return ExitError;
        }
        out << "trusted\n";
        return ExitOk;
    }
    switch (r.status) {
        case FingerprintResult::Status::Match: return ExitOk;
        case FingerprintResult::Status::New: return ExitNew;
        default: return ExitChanged;
    }
}
