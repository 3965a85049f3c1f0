#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "arena.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    std::string impl, workload;
    std::size_t pixels, block_mb;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
    std::size_t blocks;
};

inline void print_csv_header()
{
    std::cout << "impl,workload,pixels,block_mb,trial,seed,ns,checksum,blocks\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.impl << "," << r.workload << "," << r.pixels << "," << r.block_mb << ","
              << r.trial << "," << r.seed << "," << r.ns << "," << r.checksum << "," << r.blocks << "\n";
}

// ---- Per-pixel scratch types ----

struct Vec3
{
    float x, y, z;
};

struct Ray
{
    Vec3 origin, dir;
    float t_max;
};

struct Hit
{
    Vec3 point, normal;
    float t;
    std::uint32_t material;
};

// How much scratch each pixel asks for. Precomputed so both
// implementations see the same requests.
struct PixelPlan
{
    std::uint32_t bounces;
    std::uint32_t samples;
};

inline std::vector<PixelPlan> make_plan(std::size_t pixels, std::uint64_t seed)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::uint32_t> bounces(1, 8);
    std::uniform_int_distribution<std::uint32_t> samples(4, 64);
    std::vector<PixelPlan> plan;
    plan.reserve(pixels);
    for (std::size_t i = 0; i < pixels; ++i)
        plan.push_back({bounces(rng), samples(rng)});
    return plan;
}

inline Hit shade(const Ray &r, std::uint32_t bounce)
{
    float t = r.t_max / float(bounce + 1);
    Vec3 p{r.origin.x + r.dir.x * t, r.origin.y + r.dir.y * t, r.origin.z + r.dir.z * t};
    return Hit{p, Vec3{-r.dir.x, -r.dir.y, -r.dir.z}, t, bounce % 3};
}

inline std::uint64_t fold(const Hit &h, const float *samples, std::uint32_t n)
{
    std::uint64_t acc = h.material;
    acc = acc * 31 + std::uint64_t(h.t * 1000.0f);
    acc = acc * 31 + std::uint64_t(h.point.x * 100.0f + 1e4f);
    for (std::uint32_t i = 0; i < n; ++i)
        acc = acc * 131 + std::uint64_t(samples[i] * 255.0f);
    return acc;
}

// ---- Workloads ----

// One Scope per pixel; everything goes back to the arena at scope end.
inline Row run_arena_pixels(const std::vector<PixelPlan> &plan, std::size_t block_mb,
                            int trial, std::uint64_t seed)
{
    Sink s;
    MemoryArena arena(block_mb);
    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t px = 0; px < plan.size(); ++px)
        {
            Scope scope = arena.open_scope();
            Ray &ray = scope.alloc(Ray{Vec3{float(px % 640), float(px / 640), 0.0f},
                                       Vec3{0.0f, 0.0f, 1.0f}, 100.0f});
            auto hits = scope.alloc_slice<Hit *>(plan[px].bounces);
            for (std::uint32_t b = 0; b < plan[px].bounces; ++b)
                hits[b] = &scope.alloc(shade(ray, b));
            auto samples = scope.alloc_slice<float>(plan[px].samples);
            for (std::uint32_t i = 0; i < plan[px].samples; ++i)
                samples[i] = float(i) / float(plan[px].samples);
            for (std::uint32_t b = 0; b < plan[px].bounces; ++b)
                s.eat(fold(*hits[b], samples.data(), plan[px].samples));
        } });

    return Row{"arena", "pixel_scratch", plan.size(), block_mb, trial, seed, ns, s.acc,
               arena.block_count()};
}

// Baseline: new/delete for every scratch object.
inline Row run_heap_pixels(const std::vector<PixelPlan> &plan, int trial, std::uint64_t seed)
{
    Sink s;
    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t px = 0; px < plan.size(); ++px)
        {
            Ray *ray = new Ray{Vec3{float(px % 640), float(px / 640), 0.0f},
                               Vec3{0.0f, 0.0f, 1.0f}, 100.0f};
            Hit **hits = new Hit *[plan[px].bounces];
            for (std::uint32_t b = 0; b < plan[px].bounces; ++b)
                hits[b] = new Hit(shade(*ray, b));
            float *samples = new float[plan[px].samples];
            for (std::uint32_t i = 0; i < plan[px].samples; ++i)
                samples[i] = float(i) / float(plan[px].samples);
            for (std::uint32_t b = 0; b < plan[px].bounces; ++b)
                s.eat(fold(*hits[b], samples, plan[px].samples));
            delete[] samples;
            for (std::uint32_t b = 0; b < plan[px].bounces; ++b)
                delete hits[b];
            delete[] hits;
            delete ray;
        } });

    return Row{"heap", "pixel_scratch", plan.size(), 0, trial, seed, ns, s.acc, 0};
}
