/**
 * @file CommandRegistry.cpp
 * @brief Implementation file.
 */
#include "CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"
#include "Core/SnprintfCheck.h"
#include <cstring>
#include <cstdio>
#define LOG_TAG_CORE "CmdRegst"
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    POOLCTL_SNPRINTF_CHECKED(LOG_TAG_CORE, OUT, LEN, FMT, ##__VA_ARGS__)

static bool isJsonObjectReply_(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    size_t i = 0;
    while (i < len) {
        const char c = s[i];
        if (c == '\0') return false;
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return c == '{';
        }
        ++i;
    }
    return false;
}

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx) {
    if (!cmd || !fn) return false;
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) == 0) {
            Log::warn(LOG_TAG_CORE, "duplicate command: %s", cmd);
            return false;
        }
    }
    if (count >= MAX_COMMANDS) {
        Log::error(LOG_TAG_CORE, "command table full, dropping %s", cmd);
        return false;
    }

    entries[count++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen) {
    if (!cmd) {
        if (reply && replyLen) {
            if (!writeErrorJson(reply, replyLen, ErrorCode::UnknownCmd, "command")) {
                snprintf(reply, replyLen, "{\"ok\":false}");
            }
        }
        return false;
    }
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) == 0) {
            CommandRequest req{cmd, json, args};
            const bool ok = entries[i].fn(entries[i].userCtx, req, reply, replyLen);
            if (reply && replyLen) {
                if (!isJsonObjectReply_(reply, replyLen)) {
                    if (!writeErrorJson(reply, replyLen, ErrorCode::CmdHandlerFailed, "command.reply")) {
                        snprintf(reply, replyLen, "{\"ok\":false}");
                    }
                    return false;
                }
            }
            return ok;
        }
    }
    if (reply && replyLen) {
        if (!writeErrorJson(reply, replyLen, ErrorCode::UnknownCmd, "command")) {
            snprintf(reply, replyLen, "{\"ok\":false}");
        }
    }
    return false;
}

bool CommandRegistry::listJson(char* out, size_t outLen) const {
    if (!out || outLen < 3) return false;
    size_t pos = 0;
    out[pos++] = '[';
    for (uint8_t i = 0; i < count; ++i) {
        const int n = snprintf(out + pos, outLen - pos, "%s\"%s\"", (i > 0) ? "," : "", entries[i].cmd);
        if (n < 0 || (size_t)n >= outLen - pos) {
            out[outLen - 1] = '\0';
            return false;
        }
        pos += (size_t)n;
    }
    if (pos + 2 > outLen) {
        out[outLen - 1] = '\0';
        return false;
    }
    out[pos++] = ']';
    out[pos] = '\0';
    return true;
}
