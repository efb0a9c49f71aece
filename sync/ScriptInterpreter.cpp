#include "ScriptInterpreter.hpp"
#include "SyncErrors.hpp"
#include "TransferEngine.hpp"
#include "fetchsync/RemoteClient.hpp"
#include "fetchsync/RuntimeLogging.hpp"
#include <QFile>
#include <QLoggingCategory>
#include <algorithm>
#include <cctype>
#include <sstream>
Q_LOGGING_CATEGORY(fsScript, "fetchsync.script")

namespace fetchsync {

namespace {

std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool parseYesNo(const std::string &v, bool &out) {
    const std::string s = lowered(v);
    if (isTruthy(s)) {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseNumber(const std::string &v, unsigned long max, unsigned long &out) {
    if (v.empty() ||
        !std::all_of(v.begin(), v.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        return false;
    if (v.size() > 9)
        return false;
    out = std::stoul(v);
    return out > 0 && out <= max;
}

} // namespace

const char *scriptPhaseName(ScriptPhase p) {
    switch (p) {
    case ScriptPhase::Unconfigured:
        return "unconfigured";
    case ScriptPhase::Configured:
        return "configured";
    case ScriptPhase::Connected:
        return "connected";
    case ScriptPhase::Closed:
        return "closed";
    }
    return "?";
}

ScriptInterpreter::ScriptInterpreter(RemoteClient &prototype,
                                     TransferEngine &engine)
    : prototype_(prototype), engine_(engine) {}

ScriptInterpreter::~ScriptInterpreter() { closeConnection(); }

bool ScriptInterpreter::isConnected() const {
    return state_.connection && state_.connection->isConnected();
}

std::vector<std::string> ScriptInterpreter::tokenize(const std::string &line) {
    const std::string body = line.substr(0, line.find('#'));
    std::istringstream in(body);
    std::vector<std::string> out;
    std::string tok;
    while (in >> tok)
        out.push_back(tok);
    return out;
}

void ScriptInterpreter::closeConnection() {
    engine_.setClient(nullptr);
    if (state_.connection) {
        state_.connection->disconnect();
        state_.connection.reset();
    }
}

bool ScriptInterpreter::connect() {
    if (state_.options.host.empty()) {
        qCWarning(fsScript) << "connect: no host has been set";
        return false;
    }
    if (state_.connection) {
        qCInfo(fsScript) << "Closing the current connection before reconnecting";
        closeConnection();
        state_.phase = ScriptPhase::Configured;
    }

    const SessionOptions &o = state_.options;
    qCInfo(fsScript) << "Connecting to" << o.host.c_str() << "port"
                     << (o.port ? QString::number(o.port)
                                : QStringLiteral("default"))
                     << "as" << o.username.c_str() << "password"
                     << maskSecret(o.password.value_or("")).c_str();

    std::string err;
    auto conn = prototype_.newConnectionLike(o, err);
    if (!conn) {
        qCWarning(fsScript) << "Connection to" << o.host.c_str()
                            << "failed:" << err.c_str();
        return false;
    }
    state_.connection = std::move(conn);
    state_.phase = ScriptPhase::Connected;
    engine_.setClient(state_.connection.get());
    engine_.setTransferMode(state_.mode);
    qCInfo(fsScript) << "Connected to" << o.host.c_str();
    return true;
}

bool ScriptInterpreter::requireConnection(const std::string &verb) const {
    if (isConnected())
        return true;
    qCWarning(fsScript) << verb.c_str() << "ignored: not connected";
    return false;
}

bool ScriptInterpreter::applyOption(const std::string &token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) {
        qCWarning(fsScript) << "options: expected key=value, got"
                            << token.c_str();
        return false;
    }
    const std::string key = lowered(token.substr(0, eq));
    const std::string value = token.substr(eq + 1);
    SessionOptions &o = state_.options;

    if (key == "known_hosts") {
        const std::string v = lowered(value);
        if (v == "strict")
            o.known_hosts_policy = KnownHostsPolicy::Strict;
        else if (v == "accept-new" || v == "accept_new")
            o.known_hosts_policy = KnownHostsPolicy::AcceptNew;
        else if (v == "off" || v == "no")
            o.known_hosts_policy = KnownHostsPolicy::Off;
        else {
            qCWarning(fsScript) << "options: unknown known_hosts policy"
                                << value.c_str();
            return false;
        }
        return true;
    }
    if (key == "known_hosts_file") {
        if (value.empty())
            o.known_hosts_path.reset();
        else
            o.known_hosts_path = value;
        return true;
    }
    if (key == "timeout") {
        unsigned long secs = 0;
        if (!parseNumber(value, 3600, secs)) {
            qCWarning(fsScript) << "options: invalid timeout" << value.c_str();
            return false;
        }
        o.timeout_seconds = static_cast<int>(secs);
        return true;
    }
    if (key == "passive") {
        if (!parseYesNo(value, o.ftp_passive)) {
            qCWarning(fsScript) << "options: invalid passive value"
                                << value.c_str();
            return false;
        }
        return true;
    }
    qCWarning(fsScript) << "options: unknown option" << key.c_str();
    return false;
}

bool ScriptInterpreter::executeLine(const std::string &line) {
    const std::vector<std::string> tok = tokenize(line);
    if (tok.empty())
        return true;
    const std::string verb = lowered(tok[0]);
    const std::string arg = tok.size() > 1 ? tok[1] : std::string();

    auto needArg = [&](const char *what) {
        if (!arg.empty())
            return true;
        qCWarning(fsScript) << verb.c_str() << "requires" << what;
        return false;
    };

    if (verb == "host") {
        if (!needArg("a host name"))
            return false;
        state_.options.host = arg;
        if (state_.phase == ScriptPhase::Unconfigured)
            state_.phase = ScriptPhase::Configured;
        qCDebug(fsScript) << "host" << arg.c_str();
        return true;
    }
    if (verb == "port") {
        if (!needArg("a port number"))
            return false;
        unsigned long p = 0;
        if (!parseNumber(arg, 65535, p)) {
            qCWarning(fsScript) << "Invalid port" << arg.c_str();
            return false;
        }
        state_.options.port = static_cast<std::uint16_t>(p);
        return true;
    }
    if (verb == "user") {
        if (!needArg("a user name"))
            return false;
        state_.options.username = arg;
        return true;
    }
    if (verb == "password") {
        if (!needArg("a password"))
            return false;
        state_.options.password = arg;
        qCDebug(fsScript) << "password" << maskSecret(arg).c_str();
        return true;
    }
    if (verb == "private_key") {
        if (!needArg("a key file"))
            return false;
        state_.options.private_key_path = arg;
        if (tok.size() > 2)
            state_.options.private_key_passphrase = tok[2];
        return true;
    }
    if (verb == "options") {
        if (!needArg("key=value settings"))
            return false;
        bool ok = true;
        for (std::size_t i = 1; i < tok.size(); ++i)
            ok = applyOption(tok[i]) && ok;
        return ok;
    }
    if (verb == "connect")
        return connect();
    if (verb == "login") {
        if (isConnected())
            return true;
        return connect();
    }
    if (verb == "ascii" || verb == "binary") {
        state_.mode =
            verb == "ascii" ? TransferMode::Ascii : TransferMode::Binary;
        engine_.setTransferMode(state_.mode);
        qCInfo(fsScript) << "Transfer mode" << verb.c_str();
        return true;
    }
    if (verb == "cd") {
        if (!requireConnection(verb) || !needArg("a directory"))
            return false;
        return engine_.changeDirectory(arg);
    }
    if (verb == "size") {
        if (!requireConnection(verb) || !needArg("a file name"))
            return false;
        return engine_.size(arg).has_value();
    }
    if (verb == "get") {
        if (!requireConnection(verb) || !needArg("a file name"))
            return false;
        const std::string local = tok.size() > 2 ? tok[2] : std::string();
        return engine_.get(arg, local) != GetResult::Failed;
    }
    if (verb == "mget") {
        if (!requireConnection(verb) || !needArg("a file pattern"))
            return false;
        bool recursive = false;
        for (std::size_t i = 2; i < tok.size(); ++i) {
            if (tok[i] == "-r" || tok[i] == "-R")
                recursive = true;
            else
                qCWarning(fsScript) << "mget: ignoring argument"
                                    << tok[i].c_str();
        }
        return engine_.mget(arg, recursive).failed == 0;
    }
    if (verb == "quit" || verb == "bye") {
        if (state_.connection)
            qCInfo(fsScript) << "Closing connection";
        closeConnection();
        state_.phase = ScriptPhase::Closed;
        return true;
    }

    qCDebug(fsScript) << "Ignoring unrecognized command" << tok[0].c_str();
    return false;
}

bool ScriptInterpreter::runFile(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCCritical(fsScript) << "Unable to read script" << path << ":"
                             << f.errorString();
        return false;
    }
    qCInfo(fsScript) << "Running script" << path;

    int lineNo = 0;
    try {
        while (!f.atEnd()) {
            ++lineNo;
            const std::string line =
                QString::fromUtf8(f.readLine()).trimmed().toStdString();
            if (!executeLine(line))
                qCDebug(fsScript) << "Line" << lineNo << "did not complete";
        }
    } catch (const SyncAborted &e) {
        qCCritical(fsScript) << "Aborting at line" << lineNo << "of" << path
                             << ":" << e.what();
        closeConnection();
        state_.phase = ScriptPhase::Closed;
        return false;
    }

    if (state_.connection) {
        qCInfo(fsScript) << "Script ended without quit; closing connection";
        closeConnection();
        state_.phase = ScriptPhase::Closed;
    }
    return true;
}

} // namespace fetchsync
