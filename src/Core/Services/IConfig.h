#pragma once
/**
 * @file IConfig.h
 * @brief Config store service interface.
 */
#include <stdint.h>
#include <stddef.h>

/**
 * @brief Service exposed by ConfigStoreModule under the id "config".
 *
 * Documents are keyed by module name: `{"poolctl":{"reachability_timeout_ms":5000}}`.
 */
struct ConfigStoreService {
    /** False on malformed JSON or when any known key has the wrong type. */
    bool (*applyJson)(void* ctx, const char* json);
    bool (*toJson)(void* ctx, char* out, size_t outLen);
    /** Flat object of one module's variables. False when the module has none. */
    bool (*toJsonModule)(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    uint8_t (*listModules)(void* ctx, const char** out, uint8_t max);
    void* ctx;
};
