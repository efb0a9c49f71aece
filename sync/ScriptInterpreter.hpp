// Line-oriented transfer script runner.
#pragma once
#include "fetchsync/RemoteTypes.hpp"
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace fetchsync {

class RemoteClient;
class TransferEngine;

enum class ScriptPhase { Unconfigured, Configured, Connected, Closed };

const char *scriptPhaseName(ScriptPhase p);

// Session context owned by the interpreter and mutated only by commands.
struct ScriptState {
    ScriptPhase phase = ScriptPhase::Unconfigured;
    SessionOptions options;
    TransferMode mode = TransferMode::Binary;
    std::unique_ptr<RemoteClient> connection;
};

// Runs commands such as:
//
//   host ftp.example.org
//   user anonymous
//   password guest@
//   connect
//   cd pub/data
//   mget *.csv
//   quit
//
// Every connect creates a fresh connection from the prototype (through
// newConnectionLike) and hands it to the engine. A failed connect is logged
// and later connection-dependent commands become no-ops.
class ScriptInterpreter {
public:
    // prototype selects the protocol; it is never connected itself.
    ScriptInterpreter(RemoteClient &prototype, TransferEngine &engine);
    ~ScriptInterpreter();

    ScriptInterpreter(const ScriptInterpreter &) = delete;
    ScriptInterpreter &operator=(const ScriptInterpreter &) = delete;

    // Executes one line. Returns false when the command failed or was not
    // understood. SyncAborted from the engine propagates.
    bool executeLine(const std::string &line);

    // Runs a whole script. Returns false when it cannot be read or the run was
    // aborted; the connection is closed in both cases.
    bool runFile(const QString &path);

    ScriptPhase phase() const { return state_.phase; }
    const ScriptState &state() const { return state_; }
    bool isConnected() const;

    static std::vector<std::string> tokenize(const std::string &line);

private:
    RemoteClient &prototype_;
    TransferEngine &engine_;
    ScriptState state_;

    bool connect();
    void closeConnection();
    bool requireConnection(const std::string &verb) const;
    bool applyOption(const std::string &token);
};

} // namespace fetchsync
