#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "discrete_path.hpp"
#include "test_meshes.hpp"

static std::vector<Surface> ThreeFrames()
{
  const Surface base = MakeTetrahedron().V;
  std::vector<Surface> frames;
  frames.push_back(base);
  frames.push_back(Surface(base + MakeField(4, 1, 0.5)));
  frames.push_back(Surface(base*2.0));
  return frames;
}

TEST(DiscretePath, SamplesHitTheFrames)
{
  const std::vector<Surface> frames = ThreeFrames();
  const UniformlySampledDiscretePath path(frames);

  EXPECT_EQ(path.n_frames(), 3);
  EXPECT_EQ(path(0.0), frames[0]);
  EXPECT_TRUE(path(0.5).isApprox(frames[1], 1e-15));
  EXPECT_TRUE(path(1.0).isApprox(frames[2], 1e-15));
}

TEST(DiscretePath, LinearBetweenFrames)
{
  const std::vector<Surface> frames = ThreeFrames();
  const UniformlySampledDiscretePath path(frames);

  EXPECT_TRUE(path(0.25).isApprox(0.5*(frames[0] + frames[1]), 1e-14));
  EXPECT_TRUE(path(0.875).isApprox(0.25*frames[1] + 0.75*frames[2], 1e-14));
}

TEST(DiscretePath, EvaluatesSeveralTimes)
{
  const std::vector<Surface> frames = ThreeFrames();
  const UniformlySampledDiscretePath path(frames);
  Eigen::VectorXd times(3);
  times << 1.0, 0.0, 0.5;

  const SurfaceBatch samples = path(times);
  ASSERT_EQ(samples.size(), 3u);
  EXPECT_TRUE(samples[0].isApprox(frames[2], 1e-15));
  EXPECT_EQ(samples[1], frames[0]);
  EXPECT_TRUE(samples[2].isApprox(frames[1], 1e-15));
}

TEST(DiscretePath, SingleFrameIsConstant)
{
  const Surface base = MakeTetrahedron().V;
  const UniformlySampledDiscretePath path(std::vector<Surface>(1, base));
  EXPECT_EQ(path(0.3), base);
}

TEST(DiscretePath, InvalidInputsThrow)
{
  const std::vector<Surface> empty;
  EXPECT_THROW(UniformlySampledDiscretePath bad(empty), std::invalid_argument);

  std::vector<Surface> frames = ThreeFrames();
  frames.push_back(MakeField(5, 1, 1.0));
  EXPECT_THROW(UniformlySampledDiscretePath bad(frames), std::invalid_argument);

  const UniformlySampledDiscretePath path(ThreeFrames());
  EXPECT_THROW(path(-0.1), std::invalid_argument);
  EXPECT_THROW(path(1.5), std::invalid_argument);
}
