#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return tf::app::daemon_main(argc, argv);
}
