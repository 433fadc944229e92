#include <iostream>
#include <string>
#include <vector>

#include "config/ledger_config.hpp"
#include "service/ledger_bootstrap.hpp"
#include "service/ledger_service.hpp"
#include "service/request.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

void printUsage(const char *prog)
{
    std::cerr << "usage: " << prog << " <config-file> <RequestType> [caller=<id>] [key=value ...]\n"
              << "  HasClaimed        affiliate=<id> epoch=<n|YYYY-MM-DD>\n"
              << "  AffiliateTotal    affiliate=<id>\n"
              << "  GlobalTotal\n"
              << "  Status\n"
              << "  BatchDistribute   caller=<authority> epoch=<e> affiliates=a,b amounts=1,2\n"
              << "  Claim             caller=<affiliate> epoch=<e> amount=<n> signature=<hex>\n"
              << "  EmergencyWithdraw caller=<authority> amount=<n>\n"
              << "  DistributeActivity caller=<authority> epoch=<e> wallets=a,b validClicks=3,1\n";
}

} // namespace

int main(int argc, char** argv) {
    using rewardledger::util::logger::Logger;

    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    // 1. Parse configuration
    rewardledger::config::LedgerConfig ledgerConfig;
    rewardledger::util::ConfigParser configParser(ledgerConfig);
    const std::string configPath = argv[1];
    try {
        if (!configParser.loadFromFile(configPath)) {
            std::cerr << "config file not found: " << configPath << "\n";
            return 2;
        }
        configParser.validate();
    }
    catch (const std::exception &ex) {
        std::cerr << "invalid configuration: " << ex.what() << "\n";
        return 2;
    }

    // 2. Logger level and file from configuration
    Logger::getInstance().setLogLevel(rewardledger::util::logger::parseLogLevel(ledgerConfig.logLevel));
    if (!ledgerConfig.logFile.empty() && !Logger::getInstance().enableFileOutput(ledgerConfig.logFile)) {
        std::cerr << "cannot open log file: " << ledgerConfig.logFile << "\n";
    }

    // 3. Wire the ledger
    std::shared_ptr<rewardledger::distribution::RewardDistributor> ledger;
    try {
        ledger = rewardledger::service::BuildLedger(ledgerConfig);
    }
    catch (const std::exception &ex) {
        rewardledger::util::logger::critical(std::string("[main] Failed to start ledger: ") + ex.what());
        return 1;
    }

    // 4. Issue the request and print its response
    rewardledger::service::Request request;
    try {
        request = rewardledger::service::ParseRequest(std::vector<std::string>(argv + 2, argv + argc));
    }
    catch (const std::invalid_argument &ex) {
        std::cerr << ex.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    rewardledger::service::LedgerService service(ledger, ledgerConfig.rewardPerClick);
    const rewardledger::service::Response response = service.Handle(request);
    std::cout << response.ToJson() << std::endl;

    Logger::getInstance().disableFileOutput();
    return response.success ? 0 : 1;
}
