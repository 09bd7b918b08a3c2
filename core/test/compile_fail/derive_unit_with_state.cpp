#include <issame/Derive.hpp>

struct Forgot {
    int a;
    int b;

    ISSAME_DERIVE(Forgot);
};

int main() { return issame::is_same(Forgot{1, 2}, Forgot{3, 4}) ? 0 : 1; }
