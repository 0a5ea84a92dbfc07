/**
 * @file spawner.h
 * @brief Process creation
 */

#pragma once

#include "wardend/process/process.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wardend {

/**
 * @brief Everything needed to start one process
 */
struct SpawnRequest {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool copy_env = true;
    std::string working_dir;
    bool capture_output = true;
    std::vector<int> inherit_fds;  // stay open across exec
};

/**
 * @brief Creates processes for watchers
 */
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;
    
    /**
     * @throws SpawnFailure if the process could not be created
     */
    virtual std::unique_ptr<Process> spawn(const SpawnRequest& request) = 0;
};

/**
 * @brief fork/exec based spawner
 *
 * Exec failures in the child are reported back over a close-on-exec pipe,
 * so spawn() only returns once the new program image is running.
 */
class PosixSpawner : public ProcessSpawner {
public:
    std::unique_ptr<Process> spawn(const SpawnRequest& request) override;
};

} // namespace wardend
