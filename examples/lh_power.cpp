/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cinttypes>

#include <jau/cpp_lang_util.hpp>
#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include <lhpower/LHTypes.hpp>
#include <lhpower/LHStationManager.hpp>
#include <lhpower/LinuxRadio.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace lhpower;
using namespace jau;

/**
 * lh_power: scans for Lighthouse base stations and switches their power state.
 * <p>
 * Commands are executed in order of their appearance on the command line,
 * the first command implies a scan.
 * </p>
 */

enum class Command : uint8_t { SCAN, STATUS, ON, OFF, ALL_ON, ALL_OFF };

struct CommandEntry {
    Command cmd;
    std::string address;
};

static void printSnapshot(const jau::darray<StationInfo>& stations) {
    fprintf_td(stderr, "****** Stations: %zu\n", (size_t)stations.size());
    int i=0;
    for(const StationInfo& s : stations) {
        if( s.name != s.originalName ) {
            fprintf_td(stderr, "[%2.2d] %s, '%s' ('%s'), power %s\n", i, s.address.c_str(),
                    s.name.c_str(), s.originalName.c_str(), to_string(s.powerState).c_str());
        } else {
            fprintf_td(stderr, "[%2.2d] %s, '%s', power %s\n", i, s.address.c_str(),
                    s.name.c_str(), to_string(s.powerState).c_str());
        }
        ++i;
    }
}

static bool runCommand(LHStationManager& manager, const CommandEntry& c) {
    try {
        switch( c.cmd ) {
            case Command::SCAN:
                printSnapshot( manager.scanAndMerge() );
                break;
            case Command::STATUS:
                printSnapshot( manager.checkAllStatuses() );
                break;
            case Command::ON:
                manager.powerOnStation(c.address);
                fprintf_td(stderr, "****** ON: %s\n", c.address.c_str());
                break;
            case Command::OFF:
                manager.powerOffStation(c.address);
                fprintf_td(stderr, "****** OFF: %s\n", c.address.c_str());
                break;
            case Command::ALL_ON:
                manager.powerOnAll();
                fprintf_td(stderr, "****** ALL ON\n");
                break;
            case Command::ALL_OFF:
                manager.powerOffAll();
                fprintf_td(stderr, "****** ALL OFF\n");
                break;
        }
        return true;
    } catch (AggregateException &e) {
        fprintf_td(stderr, "****** FAILED: %zu station(s): %s\n", (size_t)e.errorCount(), e.message().c_str());
    } catch (jau::RuntimeException &e) {
        fprintf_td(stderr, "****** FAILED: %s\n", e.message().c_str());
    }
    return false;
}

int main(int argc, char *argv[])
{
    jau::darray<CommandEntry> commands;
    jau::darray<std::pair<std::string, std::string>> renames;

    for(int i=1; i<argc; i++) {
        if( !strcmp("-lh_debug", argv[i]) && argc > (i+1) ) {
            setenv("lhpower.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-lh_verbose", argv[i]) && argc > (i+1) ) {
            setenv("lhpower.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dev", argv[i]) && argc > (i+1) ) {
            setenv("lhpower.hci.dev", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-scan", argv[i]) ) {
            commands.push_back( CommandEntry { Command::SCAN, "" } );
        } else if( !strcmp("-status", argv[i]) ) {
            commands.push_back( CommandEntry { Command::STATUS, "" } );
        } else if( !strcmp("-on", argv[i]) && argc > (i+1) ) {
            commands.push_back( CommandEntry { Command::ON, std::string(argv[++i]) } );
        } else if( !strcmp("-off", argv[i]) && argc > (i+1) ) {
            commands.push_back( CommandEntry { Command::OFF, std::string(argv[++i]) } );
        } else if( !strcmp("-allon", argv[i]) ) {
            commands.push_back( CommandEntry { Command::ALL_ON, "" } );
        } else if( !strcmp("-alloff", argv[i]) ) {
            commands.push_back( CommandEntry { Command::ALL_OFF, "" } );
        } else if( !strcmp("-rename", argv[i]) && argc > (i+2) ) {
            const std::string originalName(argv[++i]);
            renames.push_back( std::make_pair(originalName, std::string(argv[++i])) );
        }
    }
    fprintf(stderr, "pid %d\n", getpid());

    fprintf(stderr, "Run with '[-dev <hci-index>] "
                    "[-scan] [-status] (-on <address>)* (-off <address>)* [-allon] [-alloff] "
                    "(-rename <advertised_name> <display_name>)* "
                    "[-lh_verbose true|false] "
                    "[-lh_debug true|false] "
                    "\n");

    if( 0 == commands.size() || Command::SCAN != commands[0].cmd ) {
        // stations are only known after a scan
        commands.insert(commands.cbegin(), CommandEntry { Command::SCAN, "" });
    }
    fprintf(stderr, "%s\n", LHTiming::fromEnv().toString().c_str());

    std::shared_ptr<LinuxRadio> radio = std::make_shared<LinuxRadio>();
    LHStationManager manager(radio);
    for(const auto& r : renames) {
        manager.renameStation(r.first, r.second);
    }

    int res = 0;
    try {
        manager.initialize();
    } catch (ConnectionException &e) {
        fprintf_td(stderr, "****** FAILED: %s\n", e.message().c_str());
        return 1;
    }
    fprintf_td(stderr, "****** START: %s\n", manager.toString().c_str());

    for(const CommandEntry& c : commands) {
        if( !runCommand(manager, c) ) {
            res = 1;
            if( Command::SCAN == c.cmd ) {
                break; // nothing to work on
            }
        }
    }
    printSnapshot( manager.snapshot() );

    manager.shutdown();
    fprintf_td(stderr, "****** END: %s\n", manager.toString().c_str());
    return res;
}
