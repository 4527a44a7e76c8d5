// Copyright (c) 2024 The WeFi developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <boost/filesystem/fstream.hpp>
#include <boost/program_options/detail/config_file.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <set>

const char * const WEFI_CONF_FILENAME = "wefi.conf";

ArgsManager gArgs;
bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

/**
 * The debug log file is opened lazily by OpenDebugLog() and guarded by its
 * own mutex so that concurrent log lines are not interleaved.
 */
static std::mutex g_debug_log_mutex;
static FILE* fileout = nullptr;

/** Flag to indicate, whether the next LogPrintStr call starts a new line. */
static std::atomic_bool fStartedNewLine(true);

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {WLog::NONE, "0"},
    {WLog::CLAIM, "claim"},
    {WLog::MIGRATION, "migration"},
    {WLog::DB, "db"},
    {WLog::CONFIG, "config"},
    {WLog::ALL, "1"},
    {WLog::ALL, "all"},
};

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = WLog::ALL;
            return true;
        }
        for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
            if (LogCategories[i].category == *str) {
                *f = LogCategories[i].flag;
                return true;
            }
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
        // Omit the special cases.
        if (LogCategories[i].flag != WLog::NONE && LogCategories[i].flag != WLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += LogCategories[i].category;
            outcount++;
        }
    }
    return ret;
}

bool OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(g_debug_log_mutex);
    if (fileout) return true;

    fs::path pathDebug = GetDataDir() / "debug.log";
    fileout = fopen(pathDebug.string().c_str(), "a");
    if (!fileout) {
        return false;
    }
    setbuf(fileout, nullptr); // unbuffered
    return true;
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(g_debug_log_mutex);
    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }
}

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline.
 */
static std::string LogTimestampStr(const std::string &str, std::atomic_bool *fStartedNewLine)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (*fStartedNewLine) {
        strStamped = DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime());
        if (GetMockTime()) {
            strStamped += " (mocktime)";
        }
        strStamped += ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        *fStartedNewLine = true;
    else
        *fStartedNewLine = false;

    return strStamped;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str, &fStartedNewLine);

    if (fPrintToConsole)
    {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    else if (fPrintToDebugLog)
    {
        std::lock_guard<std::mutex> scoped_lock(g_debug_log_mutex);
        if (fileout != nullptr) {
            ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
        }
    }
    return ret;
}

static int64_t atoi64(const std::string& str)
{
    return strtoll(str.c_str(), nullptr, 10);
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi64(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

std::vector<std::string> ArgsManager::ParseParameters(int argc, const char* const argv[])
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        // Everything from the first non-option on is a command and its parameters
        if (str.empty() || str[0] != '-') {
            for (int j = i; j < argc; j++) {
                positional.push_back(argv[j]);
            }
            break;
        }

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
    return positional;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

void ArgsManager::ReadConfigFile(const std::string& confPath)
{
    fs::ifstream streamConfig(GetConfigFile(confPath));
    if (!streamConfig.good())
        return; // No wefi.conf file is OK

    {
        LOCK(cs_args);
        std::set<std::string> setOptions;
        setOptions.insert("*");

        for (boost::program_options::detail::config_file_iterator it(streamConfig, setOptions), end; it != end; ++it)
        {
            // Don't overwrite existing settings so command line settings override wefi.conf
            std::string strKey = std::string("-") + it->string_key;
            std::string strValue = it->value[0];
            InterpretNegativeSetting(strKey, strValue);
            if (mapArgs.count(strKey) == 0)
                mapArgs[strKey] = strValue;
            mapMultiArgs[strKey].push_back(strValue);
        }
    }
    // If datadir is changed in .conf file:
    ClearDatadirCache();
}

static fs::path pathCached;
static CCriticalSection csPathCached;

static fs::path GetDefaultDataDir()
{
    // Unix: ~/.wefi
    char* pszHome = getenv("HOME");
    fs::path pathRet;
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".wefi";
}

const fs::path &GetDataDir()
{
    LOCK(csPathCached);

    if (!pathCached.empty())
        return pathCached;

    if (gArgs.IsArgSet("-datadir")) {
        pathCached = fs::system_complete(gArgs.GetArg("-datadir", ""));
    } else {
        pathCached = GetDefaultDataDir();
    }

    fs::create_directories(pathCached);
    return pathCached;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_complete())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string strRet = std::string(optIndent,' ') + std::string(option) + std::string("\n");
    std::string::size_type pos = 0;
    while (pos < message.size()) {
        std::string::size_type len = std::min<std::string::size_type>(screenWidth - msgIndent, message.size() - pos);
        strRet += std::string(msgIndent,' ') + message.substr(pos, len) + std::string("\n");
        pos += len;
    }
    return strRet + std::string("\n");
}
