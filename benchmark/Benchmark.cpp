#include <Cosmos/Cosmos.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

#include <fmt/format.h>

static std::vector<Cosmos::Address> MakeAddresses(std::size_t count, std::size_t offset = 0)
{
    std::vector<Cosmos::Address> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        out.emplace_back(fmt::format("CBENCH{:06}", offset + i));
    }
    return out;
}

static void BM_RegisterComponents(benchmark::State& state)
{
    const size_t count = state.range(0);
    const auto addresses = MakeAddresses(count);

    for (auto _ : state)
    {
        Cosmos::ComponentRegister reg;
        for (const auto& address : addresses)
        {
            benchmark::DoNotOptimize(reg.Register(address));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_RegisterExisting(benchmark::State& state)
{
    const auto addresses = MakeAddresses(Cosmos::ComponentRegister::Capacity());
    Cosmos::ComponentRegister reg;
    for (const auto& address : addresses)
    {
        benchmark::DoNotOptimize(reg.Register(address));
    }

    size_t i = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(reg.Register(addresses[i++ % addresses.size()]));
    }
}

static void BM_UnregisterAll(benchmark::State& state)
{
    const size_t count = state.range(0);
    const auto addresses = MakeAddresses(count);

    for (auto _ : state)
    {
        state.PauseTiming();
        Cosmos::ComponentRegister reg;
        for (const auto& address : addresses)
        {
            benchmark::DoNotOptimize(reg.Register(address));
        }
        state.ResumeTiming();

        for (auto it = addresses.rbegin(); it != addresses.rend(); ++it)
        {
            benchmark::DoNotOptimize(reg.Unregister(*it));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_WorldSpawn(benchmark::State& state)
{
    const size_t perEntity = state.range(0);
    const size_t entities = Cosmos::ComponentRegister::Capacity() / perEntity;
    const auto addresses = MakeAddresses(entities * perEntity);

    for (auto _ : state)
    {
        Cosmos::World world("bench");
        Cosmos::ComponentRegister reg;
        for (size_t e = 0; e < entities; ++e)
        {
            std::span<const Cosmos::Address> batch(addresses.data() + e * perEntity, perEntity);
            benchmark::DoNotOptimize(world.Spawn(reg, batch));
        }
    }

    state.SetItemsProcessed(state.iterations() * entities);
}

static void BM_EncodeWorld(benchmark::State& state)
{
    Cosmos::World world("bench");
    Cosmos::ComponentRegister reg;
    const auto addresses = MakeAddresses(Cosmos::ComponentRegister::Capacity());
    for (const auto& address : addresses)
    {
        benchmark::DoNotOptimize(world.Spawn(reg, std::span<const Cosmos::Address>(&address, 1)));
    }

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(Cosmos::EncodeRecord(world));
    }
}

static void BM_DecodeWorld(benchmark::State& state)
{
    Cosmos::World world("bench");
    Cosmos::ComponentRegister reg;
    const auto addresses = MakeAddresses(Cosmos::ComponentRegister::Capacity());
    for (const auto& address : addresses)
    {
        benchmark::DoNotOptimize(world.Spawn(reg, std::span<const Cosmos::Address>(&address, 1)));
    }
    const Cosmos::Bytes encoded = Cosmos::EncodeRecord(world);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(Cosmos::DecodeRecord<Cosmos::World>(encoded, state.range(0) != 0));
    }

    state.SetBytesProcessed(state.iterations() * encoded.size());
}

static void BM_LedgerSpawn(benchmark::State& state)
{
    Cosmos::Log::Get().SetMinLevel(Cosmos::LogLevel::Warning);
    const auto addresses = MakeAddresses(Cosmos::ComponentRegister::Capacity());

    for (auto _ : state)
    {
        state.PauseTiming();
        Cosmos::MemoryStore store;
        Cosmos::WorldLedger ledger(store);
        benchmark::DoNotOptimize(ledger.Genesis("bench"));
        state.ResumeTiming();

        for (const auto& address : addresses)
        {
            benchmark::DoNotOptimize(ledger.Spawn(std::span<const Cosmos::Address>(&address, 1)));
        }
    }

    state.SetItemsProcessed(state.iterations() * addresses.size());
}

static void BM_LedgerAddSystem(benchmark::State& state)
{
    Cosmos::Log::Get().SetMinLevel(Cosmos::LogLevel::Warning);
    Cosmos::MemoryStore store;
    Cosmos::WorldLedger ledger(store);
    benchmark::DoNotOptimize(ledger.Genesis("bench"));
    const Cosmos::Address handler("CHANDLER");

    std::size_t bit = 1;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(ledger.AddSystem(Cosmos::Mask::FromBit(bit), handler));
        bit = bit % 127 + 1;
    }
}

// Component registration
BENCHMARK(BM_RegisterComponents)->Arg(16)->Arg(64)->Arg(127);
BENCHMARK(BM_RegisterExisting);
BENCHMARK(BM_UnregisterAll)->Arg(16)->Arg(127);

// World aggregate
BENCHMARK(BM_WorldSpawn)->Arg(1)->Arg(4)->Arg(16);

// Records
BENCHMARK(BM_EncodeWorld);
BENCHMARK(BM_DecodeWorld)->Arg(0)->Arg(1);

// Ledger round trips through a memory store
BENCHMARK(BM_LedgerSpawn);
BENCHMARK(BM_LedgerAddSystem);

BENCHMARK_MAIN();
