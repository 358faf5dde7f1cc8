#include "daemon.h"
#include "lb_config.h"

#include <string_view>

int main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
    }

    return lb_start(argc, argv);
}
