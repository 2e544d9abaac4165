/* Test helpers: set a process-wide value for the lifetime of a scope and put
   the old one back afterwards, even when the test throws.
*/

#pragma once
#include <string>
#include <cstdlib>

// sets an environment variable, restoring (or unsetting) it on destruction
class Scoped_env {
public:
    Scoped_env(const std::string& name_, const std::string& value) : name(name_), had_old(false) {
        const char* old = getenv(name.c_str());
        if (old) {
            had_old = true;
            old_value = old;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~Scoped_env() {
        if (had_old) {
            setenv(name.c_str(), old_value.c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
    }
private:
    Scoped_env(const Scoped_env&);
    Scoped_env& operator=(const Scoped_env&);

    std::string name;
    std::string old_value;
    bool had_old;
};

// same for a plain flag, eg. a file's "silence" switch
class Scoped_flag {
public:
    Scoped_flag(bool& flag_, bool value) : flag(flag_), old_value(flag_) { flag = value; }
    ~Scoped_flag() { flag = old_value; }
private:
    Scoped_flag(const Scoped_flag&);
    Scoped_flag& operator=(const Scoped_flag&);

    bool& flag;
    bool old_value;
};
