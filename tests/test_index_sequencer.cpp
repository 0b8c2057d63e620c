#include "lwarray/lwarray.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

static std::vector<lwarray::Index> collect(const lwarray::Shape& shape) {
    std::vector<lwarray::Index> out;
    lwarray::IndexSequencer seq(shape);
    while (!seq.exhausted()) {
        out.push_back(seq.index());
        seq.advance();
    }
    return out;
}

int main() {
    try {
        using namespace lwarray;

        // Declared Dims 3 then 2 give storage shape (2,3)
        {
            CHECK((resolve_shape({3, 2}) == Shape{2, 3}));
            CHECK((resolve_shape({4, 5, 6}) == Shape{6, 5, 4}));
            CHECK((dimensions_from_shape({2, 3}) == DimensionList{3, 2}));
            CHECK(resolve_shape({}).empty());

            DimensionList d = {7, 1, 0, 4};
            CHECK(resolve_shape(dimensions_from_shape(resolve_shape(d))) == resolve_shape(d));
            CHECK(dimensions_from_shape(resolve_shape(d)) == d);
        }

        // Position 0 varies fastest
        {
            auto idx = collect({2, 3});
            std::vector<Index> expect = {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {0, 2}, {1, 2}};
            CHECK(idx == expect);
        }

        // Every index exactly once, and nothing after exhaustion
        {
            Shape s = {2, 3, 4};
            auto idx = collect(s);
            CHECK(idx.size() == numel(s));
            std::set<Index> unique(idx.begin(), idx.end());
            CHECK(unique.size() == idx.size());

            IndexSequencer seq(s);
            for (std::size_t i = 0; i < numel(s); ++i) seq.advance();
            CHECK(seq.exhausted());
            seq.advance();
            CHECK(seq.exhausted());
        }

        // A zero-size dimension yields nothing
        {
            CHECK(collect({3, 0}).empty());
            CHECK(collect({0}).empty());
            CHECK(numel({3, 0, 2}) == 0);
        }

        // Rank-0 shape holds a single element
        {
            auto idx = collect({});
            CHECK(idx.size() == 1);
            CHECK(idx[0].empty());
            CHECK(numel({}) == 1);
        }

        // One-dimensional shapes count straight up
        {
            auto idx = collect({4});
            CHECK(idx.size() == 4);
            for (std::size_t i = 0; i < idx.size(); ++i) CHECK((idx[i] == Index{i}));
        }

        // Row-major placement: last position contiguous
        {
            CHECK(flat_offset({2, 3}, {0, 0}) == 0);
            CHECK(flat_offset({2, 3}, {0, 1}) == 1);
            CHECK(flat_offset({2, 3}, {1, 0}) == 3);
            CHECK(flat_offset({2, 3}, {1, 2}) == 5);
            CHECK(flat_offset({}, {}) == 0);

            bool threw = false;
            try {
                (void)flat_offset({2, 3}, {2, 0});
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::InvalidData;
            }
            CHECK(threw);

            threw = false;
            try {
                (void)flat_offset({2, 3}, {1});
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::InvalidData;
            }
            CHECK(threw);
        }

        // Odometer order visits every storage slot once
        {
            Shape s = {3, 2, 2};
            std::vector<int> hits(numel(s), 0);
            for (const auto& i : collect(s)) ++hits[flat_offset(s, i)];
            for (int h : hits) CHECK(h == 1);
        }

        // Size overflow is reported, not wrapped
        {
            bool threw = false;
            try {
                (void)numel({std::size_t(1) << 40, std::size_t(1) << 40});
            } catch (const LwError& e) {
                threw = e.kind() == ErrorKind::InvalidData;
            }
            CHECK(threw);
        }

        std::cout << "All tests passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
