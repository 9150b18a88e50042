#include "app/HandlerMain.hpp"

int main(int argc, char *argv[])
{
    return jp::app::handler_main(argc, argv);
}
