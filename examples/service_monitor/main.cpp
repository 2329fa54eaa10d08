#include "common/Logger.h"
#include "domain/ProtectionMachine.h"
#include "domain/ServiceMachineManager.h"
#include <iostream>
#include <string>

namespace {

void printServices(const LSE::ServiceMachineManager &manager) {
    for (const auto &[serviceId, state] : manager.getAllStates()) {
        std::cout << "  " << serviceId << ": " << LSE::toString(state) << "\n";
    }
}

void report(const std::string &step, bool accepted) {
    if (!accepted) {
        std::cout << "  " << step << " rejected" << "\n";
    }
}

}  // namespace

int main() {
    LSE::Logger::initialize();

    std::cout << "=== Service Monitor Example ===" << "\n\n";

    // Protection session driven step by step
    std::cout << "Protection session:" << "\n";
    {
        auto protection = LSE::createProtectionMachine();
        auto unsubscribe = protection->subscribe([](LSE::ProtectionState state, const LSE::Context &context) {
            std::cout << "  -> " << LSE::toString(state) << " " << context.dump() << "\n";
        });

        report("start", LSE::startProtection(*protection, "strategyA"));
        report("activate", LSE::activateProtection(*protection));  // checking -> starting
        report("activate", LSE::activateProtection(*protection));  // starting -> active
        report("degrade", LSE::degradeProtection(*protection, "packet loss"));
        report("recover", LSE::attemptRecovery(*protection));
        report("recovered", LSE::completeRecovery(*protection));
        report("stop", LSE::stopProtection(*protection));

        unsubscribe();
    }

    std::cout << "\n";

    // Probing a set of services through the manager
    std::cout << "Service probes:" << "\n";
    {
        LSE::ServiceMachineManager manager;
        manager.getOrCreate("youtube");
        manager.getOrCreate("discord");
        manager.getOrCreate("telegram");

        std::cout << "  Checking " << manager.checkAll() << " services" << "\n";

        report("youtube", LSE::markServiceAvailable(*manager.getOrCreate("youtube"), 40));
        report("discord", LSE::markServiceBlocked(*manager.getOrCreate("discord")));
        report("telegram", LSE::markServiceError(*manager.getOrCreate("telegram"), "connection timed out"));
        printServices(manager);

        const auto health = LSE::serviceHealth(*manager.getOrCreate("telegram"));
        std::cout << "  telegram errors: " << health.errorCount << ", last: " << health.lastError.value_or("none")
                  << "\n";

        std::cout << "  Reset " << manager.resetAll() << " services" << "\n";
        printServices(manager);
    }

    return 0;
}
