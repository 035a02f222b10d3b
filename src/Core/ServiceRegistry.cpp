/**
 * @file ServiceRegistry.cpp
 * @brief Implementation file.
 */
#include "ServiceRegistry.h"
#include "Core/Log.h"
#define LOG_TAG_CORE "SvcRegst"

bool ServiceRegistry::add(const char* id, const void* service) {
    if (!id || id[0] == '\0' || !service) return false;
    if (getRaw(id)) {
        Log::warn(LOG_TAG_CORE, "duplicate service id: %s", id);
        return false;
    }
    if (count >= MAX_SERVICES) {
        Log::error(LOG_TAG_CORE, "service table full, dropping %s", id);
        return false;
    }
    entries[count++] = {id, service};
    return true;
}

const void* ServiceRegistry::getRaw(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].id, id) == 0)
            return entries[i].ptr;
    }
    return nullptr;
}
