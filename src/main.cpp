#include "app.hpp"

int main()
{
    runApp(std::cin, std::cout);
    return 0;
}
