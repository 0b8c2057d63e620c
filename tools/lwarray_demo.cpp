#include "lwarray/easy.hpp"

#include <cstdint>
#include <iostream>
#include <vector>


// Row-major fill for 2D: idx = c + r*cols
static std::vector<double> make_psd_2x3_rowmajor() {
    // storage rows are the last declared Dim
    // psd = [ 1 2 3
    //         4 5 6 ]
    return {1, 2, 3, 4, 5, 6};
}

int main() {
    try {
        using namespace lwarray;

        Document doc;
        Element& root = easy::new_ligo_lw(doc);

        // 2x3 double matrix, Dims named in declaration order
        easy::add_array<double>(root, "psd:array", {2, 3}, make_psd_2x3_rowmajor(), {"frequency", "segment"});

        // 1-D single precision series
        easy::add_array<float>(root, "series:array", {4}, {0.1f, 0.2f, 0.3f, 0.4f});

        // 3x3x4 int_4s
        std::vector<std::int32_t> dataC(3 * 3 * 4);
        for (std::size_t i = 0; i < dataC.size(); ++i) dataC[i] = (std::int32_t)i;
        easy::add_array<std::int32_t>(root, "counts:array", {3, 3, 4}, dataC);

        std::string file = "demo_out.xml.gz";
        WriteOptions wo;
        wo.gzip = true;
        wo.zlib_level = 6;
        write_file(file, doc, wo);
        std::cout << "Wrote: " << file << "\n";

        auto back = load_file(file, ReadOptions{.strict_fill = true});

        const Array& psd = get_array(*back, "psd");
        const NdArray& a = psd.array();
        std::cout << "Read psd: type=" << psd.type_name()
                  << " shape=[" << a.shape[0] << " x " << a.shape[1] << "]"
                  << " psd(1,2)=" << easy::at<double>(a, {1, 2})
                  << "\n";

        const Array& counts = get_array(*back, "counts");
        std::cout << "Read counts: elements=" << counts.array().size()
                  << " last=" << easy::values<std::int32_t>(counts.array()).back() << "\n";

        std::cout << "OK\n";
        return 0;

    } catch (const lwarray::LwError& e) {
        std::cerr << "LIGO_LW error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
