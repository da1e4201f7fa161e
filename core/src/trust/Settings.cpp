#include "remotix/Settings.hpp"
#include "remotix/KeyscanFetcher.hpp"
#include "remotix/Libssh2KeyFetcher.hpp"
#include "remotix/Log.hpp"
#include <QSettings>

namespace remotix {

bool parseFetcherKind(const std::string& name, FetcherKind& out) {
    if (name == "keyscan") { out = FetcherKind::Keyscan; return true; }
    if (name == "libssh2") { out = FetcherKind::Libssh2; return true; }
    return false;
}

const char* toString(FetcherKind k) {
    return k == FetcherKind::Libssh2 ? "libssh2" : "keyscan";
}

Settings Settings::load() {
    QSettings s("Remotix", "Remotix");
    return load(s);
}

Settings Settings::load(QSettings& s) {
    Settings out;
    s.beginGroup("HostKeys");
    out.keyscanProgram = s.value("keyscanProgram", QString::fromStdString(out.keyscanProgram)).toString().toStdString();
    // Out-of-range values fall back to the defaults
    const int attempt = s.value("attemptTimeoutSec", out.timeouts.attemptSeconds).toInt();
    if (attempt > 0) out.timeouts.attemptSeconds = attempt;
    const int overall = s.value("overallTimeoutMs", out.timeouts.overallMs).toInt();
    if (overall > 0) out.timeouts.overallMs = overall;
    out.storeDir = s.value("storeDir").toString().toStdString();
    const std::string fetcher = s.value("fetcher", "keyscan").toString().toStdString();
    if (!parseFetcherKind(fetcher, out.fetcher)) {
        LOGW("Unknown fetcher '%s' in settings, using keyscan", fetcher.c_str());
    }
    s.endGroup();
    return out;
}

void Settings::save(QSettings& s) const {
    s.beginGroup("HostKeys");
    s.setValue("keyscanProgram", QString::fromStdString(keyscanProgram));
    s.setValue("attemptTimeoutSec", timeouts.attemptSeconds);
    s.setValue("overallTimeoutMs", timeouts.overallMs);
    s.setValue("storeDir", QString::fromStdString(storeDir));
    s.setValue("fetcher", QString(toString(fetcher)));
    s.endGroup();
}

std::unique_ptr<HostKeyFetcher> makeFetcher(const Settings& s) {
    if (s.fetcher == FetcherKind::Libssh2) {
        return std::make_unique<Libssh2KeyFetcher>(s.timeouts);
    }
    return std::make_unique<KeyscanFetcher>(s.keyscanProgram, s.timeouts);
}

} // namespace remotix
