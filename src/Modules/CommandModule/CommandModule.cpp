/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include <string.h>
#include "Core/ErrorCodes.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"


bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    const CommandRegistry* registry = static_cast<const CommandRegistry*>(userCtx);
    if (!registry) return false;

    static const char kPrefix[] = "{\"ok\":true,\"commands\":";
    const size_t prefixLen = sizeof(kPrefix) - 1;
    if (replyLen <= prefixLen + 3) {
        if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "cmd.list")) snprintf(reply, replyLen, "{\"ok\":false}");
        return false;
    }

    memcpy(reply, kPrefix, prefixLen);
    if (!registry->listJson(reply + prefixLen, replyLen - prefixLen - 1)) {
        if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "cmd.list")) snprintf(reply, replyLen, "{\"ok\":false}");
        return false;
    }
    const size_t len = strlen(reply);
    reply[len] = '}';
    reply[len + 1] = '\0';
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    svc_.ctx = &registry;
    if (!services.add("cmd", &svc_)) {
        LOGE("service registration failed: cmd");
        return;
    }

    registry.registerHandler("cmd.list", cmdList_, &registry);

    logHub = services.get<LogHubService>("loghub");
    LOGI("CommandService registered");
}
