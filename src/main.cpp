#include <cstdio>
#include <string>
#include <curl/curl.h>

#include "ArchiveLister.h"
#include "RangeReader.h"
#include "StderrLogger.h"

// ---------------------------------------------------------------------------
// remote-archive-ls: 列出远程 .tar / .zip 里的文件名，不下载整个归档
// ---------------------------------------------------------------------------

static void PrintUsage(const char* prog)
{
    fprintf(stderr, "usage: %s [-debug] <url ending in .tar or .zip>\n", prog);
    fprintf(stderr, "  -debug   enable verbose output\n");
}

static int Run(const std::string& url, CStderrLogger& logger)
{
    CRangeReader reader(url);
    reader.SetLogger(&logger);

    CArchiveLister lister(reader, &logger);
    RangeStatus status = lister.List([](const std::string& name) {
        fprintf(stdout, "%s\n", name.c_str());
    });
    fflush(stdout);

    if (status != RANGE_OK)
    {
        std::string message = std::string(RangeStatusToString(status)) + ": " + lister.GetLastError();
        logger.Fatal(message.c_str());
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[])
{
    bool debug = false;
    std::string url;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "-debug" || arg == "--debug")
        {
            debug = true;
        }
        else if (arg == "-h" || arg == "-help" || arg == "--help")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            fprintf(stderr, "flag provided but not defined: %s\n", arg.c_str());
            PrintUsage(argv[0]);
            return 2;
        }
        else if (url.empty())
        {
            url = arg;
        }
    }

    CStderrLogger logger(debug ? RANGE_LOG_DEBUG : RANGE_LOG_INFO);

    if (url.empty())
    {
        logger.Fatal("Expected a URL as the first argument.");
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        logger.Fatal("curl_global_init failed");
        return 1;
    }

    int rc = Run(url, logger);

    curl_global_cleanup();
    return rc;
}
