#include "pilab.hpp"
#include <Eigen/Dense>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pilab;

// Two runs of four trials each over three voxels. The example selects
// trials by condition, removes a voxel by name, and stacks the runs.
int
main() {
    std::vector<std::unique_ptr<BaseVolume>> runs;
    for (int run = 1; run <= 2; ++run) {
        Eigen::MatrixXd data = Eigen::MatrixXd::Random(4, 3);
        VolumeOptions options;
        options.metasamples = MetaTable{ { "labels", { "face", "house", "face", "house" } },
                                         { "chunks", MetaField::numeric(std::vector<double>(4, run)) } };
        options.metafeatures = MetaTable{ { "names", { "v1", "v2", "v3" } } };
        runs.push_back(std::make_unique<BaseVolume>(data, options));
    }

    try {
        auto both = runs[0]->concat_samples({ runs[1].get() });
        std::cout << "Stacked volume: " << both->nsamples() << " samples x " << both->nfeatures() << " features"
                  << std::endl;
        std::cout << "  samples: " << both->meta_samples() << std::endl;

        auto faces = both->select_by_meta(MetaQuery{ { "labels", "face" } });
        std::cout << "face trials: " << faces->nsamples() << ", chunks "
                  << faces->meta_field(Axis::Samples, "chunks") << std::endl;

        auto pruned = faces->remove_by_meta(MetaQuery{ { "names", "v2" } });
        std::cout << "after removing v2: " << pruned->nfeatures() << " features "
                  << pruned->meta_field(Axis::Features, "names") << std::endl;

        pruned->zscore();
        std::cout << "z-scored data (per chunk):\n" << pruned->data() << std::endl;

        // Feature-axis stacking is rejected.
        (void)both->concat(1, { runs[0].get() });
    } catch (const UnsupportedOperation &e) {
        std::cerr << "Expected failure: " << e.what() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
