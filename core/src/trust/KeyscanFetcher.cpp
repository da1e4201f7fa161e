#include "remotix/KeyscanFetcher.hpp"
#include "remotix/Log.hpp"
#include <QDeadlineTimer>
#include <QProcess>
#include <QStringList>

namespace remotix {

KeyscanFetcher::KeyscanFetcher(std::string program, FetchTimeouts timeouts)
    : program_(std::move(program)), timeouts_(timeouts) {}

bool KeyscanFetcher::fetch(const std::string& host,
                           std::uint16_t port,
                           std::string& out,
                           std::string& err) {
    const QStringList args{
        "-p", QString::number(port),
        "-T", QString::number(timeouts_.attemptSeconds),
        "--", // a host starting with '-' is still a host
        QString::fromStdString(host),
    };

    const QDeadlineTimer deadline(timeouts_.overallMs);
    auto remainingMs = [&deadline]() { return static_cast<int>(deadline.remainingTime()); };

    QProcess proc;
    proc.setProgram(QString::fromStdString(program_));
    proc.setArguments(args);
    proc.start(QIODevice::ReadOnly);
    if (!proc.waitForStarted(remainingMs())) {
        err = program_ + " error: " + proc.errorString().toStdString();
        LOGE("%s", err.c_str());
        return false;
    }
    if (!proc.waitForFinished(remainingMs()) && proc.state() != QProcess::NotRunning) {
        proc.kill();
        (void)proc.waitForFinished(1000); // reap
        err = "Timeout fetching host key";
        LOGW("%s for %s:%u", err.c_str(), host.c_str(), static_cast<unsigned>(port));
        return false;
    }

    out = QString::fromUtf8(proc.readAllStandardOutput()).toStdString();
    const QString stderrText = QString::fromUtf8(proc.readAllStandardError()).trimmed();
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        err = program_ + " exited with code " + std::to_string(proc.exitCode());
        if (!stderrText.isEmpty()) err += ": " + stderrText.toStdString();
        return false;
    }
    if (QString::fromStdString(out).trimmed().isEmpty()) {
        err = "Could not fetch host key. Host may be unreachable or SSH not running.";
        return false;
    }
    return true;
}

} // namespace remotix
