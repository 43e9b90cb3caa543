#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "PipelineCatalog.hpp"
#include "PreProvisionStep.hpp"
#include "ProviderRegistrar.hpp"
#include "ProvisionScheduler.hpp"
#include "ClientFactoryBuilder.hpp"
#include "SignalManager.hpp"
#include "StringUtils.hpp"
#include <filesystem>
#include <iostream>
#include <csignal>

namespace {

void list_steps(const StepRegistry& registry, const PipelineCatalog& catalog) {
    std::cout << "Registered steps:\n";
    for (const auto& name : registry.names()) {
        auto step = registry.get_step(name);
        std::cout << "  " << name << " - " << step->description() << "\n";
    }

    std::cout << "\n" << catalog.stage() << " pipelines:\n";
    for (auto provider : ALL_CLOUD_PROVIDERS) {
        const auto& names = catalog.pipeline_for(provider);
        std::cout << "  " << to_string(provider) << ": ";
        std::cout << (names.empty() ? "(no steps)" : StringUtils::join(names, " -> ")) << "\n";
    }
}

std::shared_ptr<const StepExecutionStrategy> make_strategy(const GlobalConfig& global) {
    if (global.dry_run) {
        return std::make_shared<DryRunStepStrategy>();
    }
    return std::make_shared<ProductionStepStrategy>();
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    LogUtils::init(LogUtils::Level::Info);

    SignalManager::watch(SIGINT);
    SignalManager::watch(SIGTERM);
    SignalManager::setup();

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;

        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return 0;
        }

        const ConfigData& config = context.get_config_data();
        const GlobalConfig& global = config.global;

        const LogUtils::Level level = global.verbose ? LogUtils::Level::Debug : LogUtils::parse_level(global.log_level);
        if (global.log_dir != "log/") {
            LogUtils::init(level, (std::filesystem::path(global.log_dir) / "kubeprov.log").string());
        } else {
            LogUtils::set_level(level);
        }

        // 2. Build the step registry and the per-provider catalog
        auto clients = ClientFactoryBuilder::create(config.backend);
        PipelineExecutor executor(make_strategy(global), global.rollback_timeout);

        PipelineCatalog catalog(PreProvisionStep::NAME, pre_provision_table());
        StepRegistry registry;
        register_provider_steps(registry, catalog, clients, executor);

        const auto problems = catalog.validate(registry);
        if (!problems.empty()) {
            for (const auto& problem : problems) {
                LogUtils::fatal("Invalid {} pipeline: {}", catalog.stage(), problem);
            }
            LogUtils::shutdown();
            return 1;
        }

        if (context.list_steps_requested()) {
            list_steps(registry, catalog);
            LogUtils::shutdown();
            return 0;
        }

        // 3. Provision every cluster
        try {
            ProvisionScheduler scheduler(config, registry, make_strategy(global));

            ExecutionContext root;
            bool success = scheduler.run(root, [] { return SignalManager::last_signal() != 0; });

            for (const auto& report : scheduler.reports()) {
                std::cout << "[" << report.cluster << "] " << report.result.report();
            }

            if (!success) {
                result = 1;
            } else {
                LogUtils::info("All clusters provisioned successfully!");
            }
        } catch (const std::exception& e) {
            LogUtils::error("Error during provisioning: " + std::string(e.what()));
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
