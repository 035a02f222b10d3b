#pragma once
/**
 * @file ICommand.h
 * @brief Command service interface.
 *
 * Commands are named `<module>.<verb>` (`poolctl.body`, `config.apply`).
 * `json` is the full request document, `args` its argument object; handlers
 * read `args` first. Every reply is a JSON object: `{"ok":true,...}` on
 * success, the `writeErrorJson` payload otherwise.
 */
#include <stdint.h>
#include <stddef.h>

struct CommandRequest;
typedef bool (*CommandHandler)(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

/** @brief Service exposed by CommandModule under the id "cmd". */
struct CommandService {
    /** Fails on a duplicate name or a full table. */
    bool (*registerHandler)(void* ctx, const char* cmd, CommandHandler fn, void* userCtx);
    /** Returns the handler's result; unknown commands reply `UnknownCmd`. */
    bool (*execute)(void* ctx, const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    void* ctx;
};
