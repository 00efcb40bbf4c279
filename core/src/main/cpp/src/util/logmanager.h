/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include <stdexcept>

#include <boost/filesystem.hpp>

namespace keep {

    /**
     * Routes every Logger line into <dir>/keep.log.
     *
     * The file is opened in append mode; a restart banner separates runs.
     * rotate() renames the live file to a timestamped sibling and reopens.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir) : _enabled(false), _append(true), _file(0) {
            if (logdir.empty()) {
                throw std::invalid_argument("LogManager requires a log directory");
            }

            boost::system::error_code ec;
            boost::filesystem::create_directories(logdir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());
            }

            start((boost::filesystem::path(logdir) / "keep.log").string(), true);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0) {
                return "unknown-time";
            }
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                if (boost::filesystem::is_directory(lp)) {
                    throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
                }
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists){
                // two blank lines before and after
                const string msg = "\n\n***** KEEP RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if (rename( _path.c_str() , s.c_str() ) != 0) {
                    cerr << "can't rotate " << _path << ": " << errnoWithDescription() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file");
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file ) {
                fclose( _file );
            }
            _file = tmp;    // Save new file for next rotation
        }

    private:
        bool _enabled;
        bool _append;
        string _path;
        FILE *_file;
    };
}
