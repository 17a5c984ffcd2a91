#include "config.hpp"
#include "crontab.hpp"
#include "registrar.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: cronreg [options]\n"
              << "\n"
              << "Installs (or replaces) the scheduled review-processing job in the\n"
              << "current user's crontab. Other crontab entries are left untouched.\n"
              << "\n"
              << "Options:\n"
              << "  --dry-run            Print the crontab that would be installed\n"
              << "  --status             Show the installed entry for this job\n"
              << "  --remove             Remove this job's entries\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  DJANGO_PROJECT_PATH  Project directory (default: /app)\n"
              << "  PYTHON_PATH          Interpreter (default: python)\n"
              << "  ENVIRONMENT          production = daily at 02:00, otherwise every 5 minutes\n"
              << "  CRONREG_CONFIG       Config file (default: ~/.cronreg/config.json)\n"
              << "  CRONREG_CRONTAB      crontab command (default: crontab)\n"
              << "  CRONREG_LOCK_PATH    Lock file guarding crontab updates\n";
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static int run_install(cronreg::Registrar& registrar) {
    cronreg::InstallPlan plan = registrar.plan();
    std::cout << "Setting up " << upper(plan.tier) << " cron job (" << plan.schedule << ")\n";

    cronreg::InstallReport report = registrar.install();

    if (report.changed) {
        std::cout << "Cron job installed successfully!\n";
    } else {
        std::cout << "Cron job already up to date.\n";
    }
    std::cout << "Current crontab:\n";
    for (const auto& line : report.installed) {
        std::cout << line << "\n";
    }

    std::cout << "\n"
              << "Log files will be written to: " << plan.log_path << "\n"
              << "To view logs: tail -f " << plan.log_path << "\n"
              << "\n"
              << "To remove the cron job later, run:\n"
              << registrar.removal_command() << "\n"
              << "or: cronreg --remove\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    enum class Action { Install, DryRun, Status, Remove };
    Action action = Action::Install;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            action = Action::DryRun;
        } else if (std::strcmp(argv[i], "--status") == 0) {
            action = Action::Status;
        } else if (std::strcmp(argv[i], "--remove") == 0) {
            action = Action::Remove;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = cronreg::Config::load();
    cronreg::SystemCrontab crontab(config.crontab_command, config.resolved_temp_dir());
    cronreg::Registrar registrar(config, crontab);

    switch (action) {
    case Action::Install:
        return run_install(registrar);
    case Action::DryRun:
        std::cout << registrar.preview();
        return 0;
    case Action::Status: {
        auto entries = registrar.status();
        if (entries.empty()) {
            std::cout << "(no " << config.job.label << " entry installed)\n";
            return 0;
        }
        for (const auto& line : entries) {
            std::cout << line << "\n";
        }
        return 0;
    }
    case Action::Remove: {
        size_t removed = registrar.remove();
        std::cout << "Removed " << removed << " cron entr" << (removed == 1 ? "y" : "ies")
                  << " for " << config.job.label << ".\n";
        return 0;
    }
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
