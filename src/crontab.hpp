#pragma once
#include <stdexcept>
#include <string>

namespace cronreg {

// The scheduler tool is missing, refused access, or rejected the table
class CrontabError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Abstract access to the invoking account's job registration table
// (injectable for testing)
class CrontabStore {
public:
    virtual ~CrontabStore() = default;

    // Full table text; "" when the account has no table yet.
    virtual std::string read() = 0;

    // Replace the whole table in one step. On failure the previous
    // table must remain installed.
    virtual void write(const std::string& contents) = 0;
};

// Drives the host crontab(1) tool
class SystemCrontab : public CrontabStore {
public:
    explicit SystemCrontab(std::string command = "crontab", std::string temp_dir = {});

    std::string read() override;
    void write(const std::string& contents) override;

    const std::string& command() const { return command_; }

private:
    std::string command_;
    std::string temp_dir_;
};

} // namespace cronreg
