#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <string>
#include "workloads.hpp"

static void print_metadata(){
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
}

struct Args
{
    std::size_t width = 640;
    std::size_t height = 480;
    std::size_t block_mb = 1;
    int trials = 8;
    std::uint64_t seed0 = 42;
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        { if (i+1<argc){ out = argv[++i]; } };
        std::string v;
        if (s == "--trials")
        {
            next(v);
            a.trials = std::stoi(v);
        }
        else if (s == "--width")
        {
            next(v);
            a.width = std::stoull(v);
        }
        else if (s == "--height")
        {
            next(v);
            a.height = std::stoull(v);
        }
        else if (s == "--block-mb")
        {
            next(v);
            a.block_mb = std::stoull(v);
        }
        else if (s == "--seed")
        {
            next(v);
            a.seed0 = std::stoull(v);
        }
        else
        {
            std::fprintf(stderr, "unknown option: %s\n", s.c_str());
            std::exit(2);
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "bad option value: %s\n", e.what());
        return 2;
    }
    print_metadata();
    print_csv_header();

    const std::size_t pixels = a.width * a.height;
    int mismatches = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        std::uint64_t seed = a.seed0 + t * 1315423911ull;
        auto plan = make_plan(pixels, seed);

        auto r1 = run_arena_pixels(plan, a.block_mb, t, seed);
        print_row(r1);
        auto r2 = run_heap_pixels(plan, t, seed);
        print_row(r2);

        if (r1.checksum != r2.checksum)
        {
            std::fprintf(stderr, "# checksum mismatch in trial %d\n", t);
            ++mismatches;
        }
    }
    return mismatches == 0 ? 0 : 1;
}
