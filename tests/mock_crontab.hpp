#pragma once
#include "crontab.hpp"

namespace cronreg {

class MockCrontab : public CrontabStore {
public:
    std::string table;
    bool fail_read = false;
    bool fail_write = false;
    int read_count = 0;
    int write_count = 0;

    std::string read() override {
        read_count++;
        if (fail_read) throw CrontabError("crontab: mock read failure");
        return table;
    }

    void write(const std::string& contents) override {
        write_count++;
        if (fail_write) throw CrontabError("crontab: permission denied");
        table = contents;
    }
};

} // namespace cronreg
