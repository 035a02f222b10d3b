#include <unity.h>
#include <stdio.h>
#include <string.h>

#include "Core/CommandRegistry.h"
#include "Core/ConfigStore.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"
#include "Core/LogHub.h"
#include "Core/ModuleManager.h"
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/Logs/LogConsoleSinkModule/LogConsoleSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "../support/RtosTestMain.h"

void setUp() {}
void tearDown() {}

// ---------------------------------------------------------------------------
// ConfigStore

struct CfgTally {
    int32_t lastValue = 0;
    uint8_t calls = 0;
};

static void onTallyChanged(void* ctx, const int32_t& value)
{
    CfgTally* t = static_cast<CfgTally*>(ctx);
    t->lastValue = value;
    ++t->calls;
}

void test_config_register_rejects_duplicate_key()
{
    ConfigStore cfg;
    int32_t a = 1;
    int32_t b = 2;
    ConfigVariable<int32_t,0> va{"period", "demo", ConfigType::Int32, &a};
    ConfigVariable<int32_t,0> vb{"period", "demo", ConfigType::Int32, &b};
    TEST_ASSERT_TRUE(cfg.registerVar(va));
    TEST_ASSERT_FALSE(cfg.registerVar(vb));
    TEST_ASSERT_EQUAL_UINT16(1, cfg.count());
}

void test_config_apply_fires_handlers_only_on_change()
{
    ConfigStore cfg;
    CfgTally tally;
    int32_t period = 10;
    bool enabled = false;
    ConfigVariable<int32_t,1> periodVar{"period", "demo", ConfigType::Int32, &period};
    ConfigVariable<bool,0> enabledVar{"enabled", "demo", ConfigType::Bool, &enabled};
    periodVar.addHandler(onTallyChanged, &tally);
    cfg.registerVar(periodVar);
    cfg.registerVar(enabledVar);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"demo\":{\"period\":25,\"enabled\":true}}"));
    TEST_ASSERT_EQUAL_INT32(25, period);
    TEST_ASSERT_TRUE(enabled);
    TEST_ASSERT_EQUAL_UINT8(1, tally.calls);
    TEST_ASSERT_EQUAL_INT32(25, tally.lastValue);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"demo\":{\"period\":25}}"));
    TEST_ASSERT_EQUAL_UINT8(1, tally.calls);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"other\":{\"period\":99}}"));
    TEST_ASSERT_EQUAL_INT32(25, period);
}

void test_config_type_mismatch_keeps_value_and_applies_the_rest()
{
    ConfigStore cfg;
    int32_t period = 10;
    bool enabled = false;
    ConfigVariable<int32_t,0> periodVar{"period", "demo", ConfigType::Int32, &period};
    ConfigVariable<bool,0> enabledVar{"enabled", "demo", ConfigType::Bool, &enabled};
    cfg.registerVar(periodVar);
    cfg.registerVar(enabledVar);

    TEST_ASSERT_FALSE(cfg.applyJson("{\"demo\":{\"period\":\"fast\",\"enabled\":true}}"));
    TEST_ASSERT_EQUAL_INT32(10, period);
    TEST_ASSERT_TRUE(enabled);

    TEST_ASSERT_FALSE(cfg.applyJson("not json"));
    TEST_ASSERT_FALSE(cfg.applyJson(""));
}

void test_config_to_json()
{
    ConfigStore cfg;
    int32_t period = 30;
    bool enabled = true;
    uint8_t level = 2;
    ConfigVariable<int32_t,0> periodVar{"period", "demo", ConfigType::Int32, &period};
    ConfigVariable<bool,0> enabledVar{"enabled", "demo", ConfigType::Bool, &enabled};
    ConfigVariable<uint8_t,0> levelVar{"min_level", "log", ConfigType::UInt8, &level};
    cfg.registerVar(periodVar);
    cfg.registerVar(enabledVar);
    cfg.registerVar(levelVar);

    char out[128];
    TEST_ASSERT_TRUE(cfg.toJson(out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("{\"demo\":{\"period\":30,\"enabled\":true},\"log\":{\"min_level\":2}}", out);

    TEST_ASSERT_TRUE(cfg.toJsonModule("log", out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("{\"min_level\":2}", out);
    TEST_ASSERT_FALSE(cfg.toJsonModule("missing", out, sizeof(out)));

    const char* modules[4];
    TEST_ASSERT_EQUAL_UINT8(2, cfg.listModules(modules, 4));
    TEST_ASSERT_EQUAL_STRING("demo", modules[0]);
    TEST_ASSERT_EQUAL_STRING("log", modules[1]);
}

struct ApplyJob {
    ConfigStore* cfg;
    const char* module;
    int32_t* value;
    uint32_t rounds;
    volatile uint32_t failures;
    SemaphoreHandle_t done;
};

static void applyTask(void* pv)
{
    ApplyJob* job = static_cast<ApplyJob*>(pv);
    char json[64];
    for (uint32_t i = 0; i < job->rounds; ++i) {
        snprintf(json, sizeof(json), "{\"%s\":{\"value\":%lu}}", job->module, (unsigned long)i);
        if (!job->cfg->applyJson(json) || *job->value != (int32_t)i) job->failures = job->failures + 1;
        taskYIELD();
    }
    xSemaphoreGive(job->done);
    vTaskDelete(nullptr);
}

void test_config_apply_from_concurrent_tasks()
{
    ConfigStore cfg;
    int32_t alpha = -1;
    int32_t beta = -1;
    ConfigVariable<int32_t,0> alphaVar{"value", "alpha", ConfigType::Int32, &alpha};
    ConfigVariable<int32_t,0> betaVar{"value", "beta", ConfigType::Int32, &beta};
    TEST_ASSERT_TRUE(cfg.registerVar(alphaVar));
    TEST_ASSERT_TRUE(cfg.registerVar(betaVar));

    ApplyJob a{&cfg, "alpha", &alpha, 300, 0, xSemaphoreCreateBinary()};
    ApplyJob b{&cfg, "beta", &beta, 300, 0, xSemaphoreCreateBinary()};
    TEST_ASSERT_NOT_NULL(a.done);
    TEST_ASSERT_NOT_NULL(b.done);
    TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(applyTask, "cfgA", 4096, &a, 1, nullptr));
    TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(applyTask, "cfgB", 4096, &b, 1, nullptr));

    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(a.done, pdMS_TO_TICKS(10000)));
    TEST_ASSERT_EQUAL(pdTRUE, xSemaphoreTake(b.done, pdMS_TO_TICKS(10000)));
    vSemaphoreDelete(a.done);
    vSemaphoreDelete(b.done);

    TEST_ASSERT_EQUAL_UINT32(0, a.failures);
    TEST_ASSERT_EQUAL_UINT32(0, b.failures);
    TEST_ASSERT_EQUAL_INT32(299, alpha);
    TEST_ASSERT_EQUAL_INT32(299, beta);
}

// ---------------------------------------------------------------------------
// ServiceRegistry / ModuleManager

void test_service_registry_first_registration_wins()
{
    ServiceRegistry services;
    int first = 1;
    int second = 2;
    TEST_ASSERT_TRUE(services.add("svc", &first));
    TEST_ASSERT_FALSE(services.add("svc", &second));
    TEST_ASSERT_FALSE(services.add("empty", nullptr));
    TEST_ASSERT_EQUAL_PTR(&first, services.get<int>("svc"));
    TEST_ASSERT_NULL(services.get<int>("missing"));
    TEST_ASSERT_EQUAL_UINT8(1, services.size());
}

static char g_initTrace[32];

class StubModule : public ModulePassive {
public:
    StubModule(const char* id, const char* dep) : id_(id), dep_(dep) {}

    const char* moduleId() const override { return id_; }
    uint8_t dependencyCount() const override { return dep_ ? 1 : 0; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? dep_ : nullptr; }

    void init(ConfigStore&, ServiceRegistry&) override {
        strncat(g_initTrace, id_, sizeof(g_initTrace) - strlen(g_initTrace) - 1);
    }
    void onConfigLoaded(ConfigStore&, ServiceRegistry&) override { ++configLoaded; }

    uint8_t configLoaded = 0;

private:
    const char* id_;
    const char* dep_;
};

class CountingModule : public Module {
public:
    const char* moduleId() const override { return "counter"; }
    const char* taskName() const override { return "counter"; }
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override { return (i == 0) ? "a" : nullptr; }

    void init(ConfigStore&, ServiceRegistry&) override {}
    void loop() override { loops = loops + 1; }
    TickType_t loopDelayTicks() const override { return pdMS_TO_TICKS(1); }

    volatile uint32_t loops = 0;

protected:
    void onTaskExit() override { exited = true; }

public:
    volatile bool exited = false;
};

void test_module_manager_inits_in_dependency_order()
{
    g_initTrace[0] = '\0';
    ConfigStore cfg;
    ServiceRegistry services;
    StubModule c("c", "b");
    StubModule b("b", "a");
    StubModule a("a", nullptr);
    CountingModule counter;

    ModuleManager mm;
    TEST_ASSERT_TRUE(mm.add(&c));
    TEST_ASSERT_TRUE(mm.add(&counter));
    TEST_ASSERT_TRUE(mm.add(&b));
    TEST_ASSERT_TRUE(mm.add(&a));
    TEST_ASSERT_TRUE(mm.initAll(cfg, services));

    TEST_ASSERT_EQUAL_STRING("abc", g_initTrace);
    TEST_ASSERT_EQUAL_STRING("a", mm.getOrdered(0)->moduleId());
    TEST_ASSERT_EQUAL_UINT8(1, a.configLoaded);
    TEST_ASSERT_EQUAL_UINT8(1, c.configLoaded);
    TEST_ASSERT_NULL(a.getTaskHandle());
    TEST_ASSERT_NOT_NULL(counter.getTaskHandle());

    vTaskDelay(pdMS_TO_TICKS(20));
    TEST_ASSERT_TRUE(counter.loops > 0);

    mm.stopAll(pdMS_TO_TICKS(500));
    TEST_ASSERT_TRUE(counter.exited);
    TEST_ASSERT_NULL(counter.getTaskHandle());
}

void test_module_manager_rejects_missing_dependency()
{
    g_initTrace[0] = '\0';
    ConfigStore cfg;
    ServiceRegistry services;
    StubModule a("a", nullptr);
    StubModule orphan("o", "poolbus");

    ModuleManager mm;
    mm.add(&a);
    mm.add(&orphan);
    TEST_ASSERT_FALSE(mm.initAll(cfg, services));
    TEST_ASSERT_EQUAL_STRING("", g_initTrace);
}

void test_module_manager_rejects_cycle()
{
    ConfigStore cfg;
    ServiceRegistry services;
    StubModule x("x", "y");
    StubModule y("y", "x");

    ModuleManager mm;
    mm.add(&x);
    mm.add(&y);
    TEST_ASSERT_FALSE(mm.initAll(cfg, services));
}

// ---------------------------------------------------------------------------
// Errors / commands

void test_error_json_payload()
{
    char out[128];
    TEST_ASSERT_TRUE(writeErrorJson(out, sizeof(out), ErrorCode::IoError, "poolctl.body"));
    TEST_ASSERT_EQUAL_STRING(
        "{\"ok\":false,\"err\":{\"code\":\"IoError\",\"where\":\"poolctl.body\",\"retryable\":true}}", out);

    TEST_ASSERT_TRUE(writeErrorJson(out, sizeof(out), ErrorCode::FeatureReadOnly, nullptr));
    TEST_ASSERT_EQUAL_STRING(
        "{\"ok\":false,\"err\":{\"code\":\"FeatureReadOnly\",\"where\":\"unknown\",\"retryable\":false}}", out);

    TEST_ASSERT_FALSE(writeErrorJson(out, 16, ErrorCode::Stopped, "x"));
    TEST_ASSERT_TRUE(errorCodeRetryable(ErrorCode::NotReady));
    TEST_ASSERT_FALSE(errorCodeRetryable(ErrorCode::Stopped));
    TEST_ASSERT_FALSE(errorCodeRetryable(ErrorCode::InvalidTemperature));
}

static bool echoHandler(void*, const CommandRequest& req, char* reply, size_t replyLen)
{
    snprintf(reply, replyLen, "{\"ok\":true,\"cmd\":\"%s\"}", req.cmd);
    return true;
}

static bool plainTextHandler(void*, const CommandRequest&, char* reply, size_t replyLen)
{
    snprintf(reply, replyLen, "done");
    return true;
}

void test_command_registry_dispatch()
{
    CommandRegistry reg;
    char reply[160];

    TEST_ASSERT_TRUE(reg.registerHandler("demo.echo", echoHandler, nullptr));
    TEST_ASSERT_FALSE(reg.registerHandler("demo.echo", echoHandler, nullptr));
    TEST_ASSERT_TRUE(reg.registerHandler("demo.text", plainTextHandler, nullptr));

    TEST_ASSERT_TRUE(reg.execute("demo.echo", "{}", "{}", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"cmd\":\"demo.echo\"}", reply);

    TEST_ASSERT_FALSE(reg.execute("demo.text", "{}", "{}", reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "\"code\":\"CmdHandlerFailed\""));

    TEST_ASSERT_FALSE(reg.execute("demo.none", "{}", "{}", reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "\"code\":\"UnknownCmd\""));

    char list[64];
    TEST_ASSERT_TRUE(reg.listJson(list, sizeof(list)));
    TEST_ASSERT_EQUAL_STRING("[\"demo.echo\",\"demo.text\"]", list);
    TEST_ASSERT_FALSE(reg.listJson(list, 10));
}

void test_command_module_lists_commands()
{
    ConfigStore cfg;
    ServiceRegistry services;
    CommandModule cmd;
    cmd.init(cfg, services);

    const CommandService* svc = services.get<CommandService>("cmd");
    TEST_ASSERT_NOT_NULL(svc);
    TEST_ASSERT_TRUE(svc->registerHandler(svc->ctx, "demo.echo", echoHandler, nullptr));

    char reply[128];
    TEST_ASSERT_TRUE(svc->execute(svc->ctx, "cmd.list", "", "", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"commands\":[\"cmd.list\",\"demo.echo\"]}", reply);

    char tiny[30];
    TEST_ASSERT_FALSE(svc->execute(svc->ctx, "cmd.list", "", "", tiny, sizeof(tiny)));
}

void test_config_commands()
{
    ConfigStore cfg;
    ServiceRegistry services;
    CommandModule cmd;
    ConfigStoreModule cfgModule;
    int32_t period = 100;
    ConfigVariable<int32_t,0> periodVar{"period", "demo", ConfigType::Int32, &period};
    cfg.registerVar(periodVar);

    cmd.init(cfg, services);
    cfgModule.init(cfg, services);
    cfgModule.onConfigLoaded(cfg, services);
    TEST_ASSERT_NOT_NULL(services.get<ConfigStoreService>("config"));

    const CommandService* svc = services.get<CommandService>("cmd");
    char reply[256];

    TEST_ASSERT_TRUE(svc->execute(svc->ctx, "config.get", "{\"module\":\"demo\"}",
                                  "{\"module\":\"demo\"}", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"config\":{\"period\":100}}", reply);

    TEST_ASSERT_TRUE(svc->execute(svc->ctx, "config.apply", "{\"demo\":{\"period\":250}}",
                                  "{\"demo\":{\"period\":250}}", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true}", reply);
    TEST_ASSERT_EQUAL_INT32(250, period);

    TEST_ASSERT_TRUE(svc->execute(svc->ctx, "config.get", "", "", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"config\":{\"demo\":{\"period\":250}}}", reply);

    TEST_ASSERT_FALSE(svc->execute(svc->ctx, "config.apply", "{\"demo\":{\"period\":true}}",
                                   "{\"demo\":{\"period\":true}}", reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "CfgApplyFailed"));
    TEST_ASSERT_FALSE(svc->execute(svc->ctx, "config.apply", "", "", reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "MissingArgs"));
    TEST_ASSERT_FALSE(svc->execute(svc->ctx, "config.get", "[1]", "[1]", reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "BadCfgJson"));
}

// ---------------------------------------------------------------------------
// Logging

struct CapturedLog {
    uint8_t count = 0;
    LogEntry last{};
};

static void captureSink(void* ctx, const LogEntry& e)
{
    CapturedLog* cap = static_cast<CapturedLog*>(ctx);
    cap->last = e;
    ++cap->count;
}

static LogEntry makeEntry(LogLevel lvl, const char* msg)
{
    LogEntry e{};
    e.lvl = lvl;
    strncpy(e.tag, "PoolCtrl", LOG_TAG_MAX - 1);
    strncpy(e.msg, msg, LOG_MSG_MAX - 1);
    return e;
}

void test_log_hub_filters_and_counts_drops()
{
    LogHub hub;
    TEST_ASSERT_FALSE(hub.enqueue(makeEntry(LogLevel::Info, "before init")));

    hub.init(2);
    hub.setMinLevel(LogLevel::Warn);
    TEST_ASSERT_TRUE(hub.enqueue(makeEntry(LogLevel::Info, "filtered")));
    TEST_ASSERT_TRUE(hub.enqueue(makeEntry(LogLevel::Warn, "one")));
    TEST_ASSERT_TRUE(hub.enqueue(makeEntry(LogLevel::Error, "two")));
    TEST_ASSERT_FALSE(hub.enqueue(makeEntry(LogLevel::Error, "three")));
    TEST_ASSERT_EQUAL_UINT32(1, hub.dropped());

    LogEntry out{};
    TEST_ASSERT_TRUE(hub.dequeue(out, 0));
    TEST_ASSERT_EQUAL_STRING("one", out.msg);
    TEST_ASSERT_TRUE(hub.dequeue(out, 0));
    TEST_ASSERT_EQUAL_STRING("two", out.msg);
    TEST_ASSERT_FALSE(hub.dequeue(out, 0));
}

void test_log_pipeline_delivers_to_sinks()
{
    ConfigStore cfg;
    ServiceRegistry services;
    LogHubModule* hubModule = new LogHubModule();
    LogDispatcherModule dispatcher;
    CapturedLog cap;

    hubModule->init(cfg, services);
    dispatcher.init(cfg, services);
    TEST_ASSERT_TRUE(dispatcher.ready());

    const LogSinkRegistryService* sinks = services.get<LogSinkRegistryService>("logsinks");
    TEST_ASSERT_TRUE(sinks->add(sinks->ctx, LogSinkService{captureSink, &cap}));

    TEST_ASSERT_TRUE(cfg.applyJson("{\"log\":{\"min_level\":2}}"));
    hubModule->onConfigLoaded(cfg, services);
    (void)dispatcher.dispatchPending(0);
    cap.count = 0;
    TEST_ASSERT_FALSE(Log::enabled(LogLevel::Info));
    TEST_ASSERT_TRUE(Log::enabled(LogLevel::Warn));

    Log::info("PoolCtrl", "not shown");
    Log::warn("PoolCtrl", "unreachable since %d s", 12);
    TEST_ASSERT_EQUAL_UINT16(1, dispatcher.dispatchPending(pdMS_TO_TICKS(50)));
    TEST_ASSERT_EQUAL_UINT8(1, cap.count);
    TEST_ASSERT_EQUAL_STRING("PoolCtrl", cap.last.tag);
    TEST_ASSERT_EQUAL_STRING("unreachable since 12 s", cap.last.msg);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LogLevel::Warn, (uint8_t)cap.last.lvl);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"log\":{\"min_level\":9}}"));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)LogLevel::Error, (uint8_t)hubModule->hub().minLevel());

    delete hubModule;
    TEST_ASSERT_NULL(Log::hub());
    Log::error("PoolCtrl", "dropped without a hub");
}

void test_console_line_format()
{
    LogEntry e = makeEntry(LogLevel::Warn, "exchange mismatch");
    e.ts_ms = 3723004;

    char line[LOG_MSG_MAX + 48];
    LogConsoleSinkModule::formatLine(e, line, sizeof(line));

    TEST_ASSERT_EQUAL_CHAR('[', line[0]);
    const char* suffix = "][W][PoolCtrl] exchange mismatch";
    const size_t len = strlen(line);
    TEST_ASSERT_TRUE(len > strlen(suffix));
    TEST_ASSERT_EQUAL_STRING(suffix, line + len - strlen(suffix));
}

static int runTests()
{
    UNITY_BEGIN();
    RUN_TEST(test_config_register_rejects_duplicate_key);
    RUN_TEST(test_config_apply_fires_handlers_only_on_change);
    RUN_TEST(test_config_type_mismatch_keeps_value_and_applies_the_rest);
    RUN_TEST(test_config_to_json);
    RUN_TEST(test_config_apply_from_concurrent_tasks);
    RUN_TEST(test_service_registry_first_registration_wins);
    RUN_TEST(test_module_manager_inits_in_dependency_order);
    RUN_TEST(test_module_manager_rejects_missing_dependency);
    RUN_TEST(test_module_manager_rejects_cycle);
    RUN_TEST(test_error_json_payload);
    RUN_TEST(test_command_registry_dispatch);
    RUN_TEST(test_command_module_lists_commands);
    RUN_TEST(test_config_commands);
    RUN_TEST(test_log_hub_filters_and_counts_drops);
    RUN_TEST(test_log_pipeline_delivers_to_sinks);
    RUN_TEST(test_console_line_format);
    return UNITY_END();
}

int main()
{
    return runUnderScheduler(runTests);
}
