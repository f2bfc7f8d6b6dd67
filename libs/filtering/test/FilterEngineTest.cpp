#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "FilterEngine.h"

using namespace chartsieve;

namespace
{
  using Engine = FilterEngine<DecimalType>;

  ChartCatalog<DecimalType> createFilterCatalog()
  {
    return ChartCatalog<DecimalType>(createDataset({
        createSource("ES", {
            createTradingDay("ES", "20240103", "GAP UP", "0.1%-0.25%", true, false,
                             createUpBars("20240103", 12)),
            createTradingDay("ES", "20240104", "GAP DOWN", "0.5%-1.0%", false, true,
                             createDownBars("20240104", 9))
          }),
        createSource("NQ", {
            createTradingDay("NQ", "20240102", "FLAT", "0-0.1%", false, false,
                             createUpBars("20240102", 7)),
            createTradingDay("NQ", "20240105", "FLAT", "0-0.1%", false, false,
                             createUpBars("20240105", 4))
          }),
        createSource("CL", {
            createTradingDay("CL", "20240103", "GAP UP", "1.0%+", true, true,
                             createUpBars("20240103", 6))
          })
      }));
  }

  std::vector<std::string> keysOf(const std::vector<Engine::ViewPtr>& views)
  {
    std::vector<std::string> keys;
    for (const auto& view : views)
      keys.push_back(view->getKey());
    return keys;
  }
}

TEST_CASE ("FilterEngine entry level filters", "[FilterEngine]")
{
  ChartCatalog<DecimalType> catalog = createFilterCatalog();
  FilterSpec spec;

  SECTION ("An empty filter returns every day with enough bars in catalog order")
    {
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all",
                                        "ES-20240104-5min-all",
                                        "NQ-20240102-5min-all",
                                        "CL-20240103-5min-all"});
    }

  SECTION ("Source membership")
    {
      spec.addSource("NQ");
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"NQ-20240102-5min-all"});
    }

  SECTION ("Gap direction membership")
    {
      spec.addGapDirection("GAP UP");
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all", "CL-20240103-5min-all"});
    }

  SECTION ("Gap size membership is a disjunction over the selected classes")
    {
      spec.addGapSizeClass("0.5%-1.0%");
      spec.addGapSizeClass("1.0%+");
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240104-5min-all", "CL-20240103-5min-all"});
    }

  SECTION ("Dimensions combine as a conjunction")
    {
      spec.addGapDirection("GAP UP");
      spec.addSource("ES");
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all"});
    }

  SECTION ("Prior day conditions are ANDed")
    {
      spec.addPriorDayCondition(PriorDayCondition::OpenAbovePrevHigh);
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all", "CL-20240103-5min-all"});

      spec.addPriorDayCondition(PriorDayCondition::CloseBelowPrevLow);
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"CL-20240103-5min-all"});
    }

  SECTION ("Nothing matches")
    {
      spec.addSource("RTY");
      REQUIRE (Engine::generate(catalog, spec).empty());
    }
}

TEST_CASE ("FilterEngine view generation", "[FilterEngine]")
{
  ChartCatalog<DecimalType> catalog = createFilterCatalog();
  FilterSpec spec;

  SECTION ("Frequencies expand each day and short aggregated views are dropped")
    {
      spec.addFrequency(BarFrequency(5));
      spec.addFrequency(BarFrequency(10));

      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all",
                                        "ES-20240103-10min-all",
                                        "ES-20240104-5min-all",
                                        "ES-20240104-10min-all",
                                        "NQ-20240102-5min-all",
                                        "CL-20240103-5min-all"});
    }

  SECTION ("Bars options follow the frequency in the output order")
    {
      spec.addSource("ES");
      spec.addBarsOption(BarsOption::limited(5));
      spec.addBarsOption(BarsOption::limited(8));

      auto views = Engine::generate(catalog, spec);
      REQUIRE (keysOf(views) ==
               std::vector<std::string>{"ES-20240103-5min-5",
                                        "ES-20240103-5min-8",
                                        "ES-20240104-5min-5",
                                        "ES-20240104-5min-8"});
      REQUIRE (views[0]->getNumBars() == 5);
      REQUIRE (views[1]->getNumBars() == 8);
    }

  SECTION ("A limit covering the longest day is treated as the whole day")
    {
      spec.addSource("ES");
      spec.addBarsOption(BarsOption::limited(12));
      spec.addBarsOption(BarsOption::allBars());
      spec.addBarsOption(BarsOption::limited(999));

      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all", "ES-20240104-5min-all"});
    }

  SECTION ("A frequency the base frequency does not divide is a configuration error")
    {
      spec.addFrequency(BarFrequency(7));
      REQUIRE_THROWS_AS (Engine::generate(catalog, spec), BarFrequencyException);
    }
}

TEST_CASE ("FilterEngine per bar constraints", "[FilterEngine]")
{
  ChartCatalog<DecimalType> catalog = createFilterCatalog();
  FilterSpec spec;

  SECTION ("Direction constraint")
    {
      spec.addBarConstraint(BarConstraint(1, BarDirection::Up));
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all",
                                        "NQ-20240102-5min-all",
                                        "CL-20240103-5min-all"});

      spec.addBarConstraint(BarConstraint(1, BarDirection::Down));
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240104-5min-all"});
    }

  SECTION ("Body ratio constraint")
    {
      spec.addBarConstraint(BarConstraint(2, BarDirection::Up, BodyRatioClass::Above75));
      REQUIRE (Engine::generate(catalog, spec).empty());

      spec.addBarConstraint(BarConstraint(2, BarDirection::Up, BodyRatioClass::From50To75));
      REQUIRE (Engine::generate(catalog, spec).size() == 3);
    }

  SECTION ("A bar the view does not have excludes the view")
    {
      spec.addBarConstraint(BarConstraint(7, BarDirection::Up));
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-5min-all", "NQ-20240102-5min-all"});

      spec.addBarConstraint(BarConstraint(20, BarDirection::Up));
      REQUIRE (Engine::generate(catalog, spec).empty());
    }

  SECTION ("Constraints are checked on the aggregated bars")
    {
      spec.addSource("ES");
      spec.addFrequency(BarFrequency(10));
      spec.addBarConstraint(BarConstraint(6, BarDirection::Up));

      // ES 20240103 at 10min has 6 bars, ES 20240104 only 5
      REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
               std::vector<std::string>{"ES-20240103-10min-all"});
    }
}

TEST_CASE ("FilterEngine drops a trading day without bars", "[FilterEngine]")
{
  ChartCatalog<DecimalType> catalog(createDataset({
      createSource("ES", {
          createTradingDay("ES", "20240102", createUpBars("20240102", 6)),
          createTradingDay("ES", "20240103", BarVector())
        })
    }));
  FilterSpec spec;

  REQUIRE (keysOf(Engine::generate(catalog, spec)) ==
           std::vector<std::string>{"ES-20240102-5min-all"});

  spec.addFrequency(BarFrequency(10));
  spec.addBarsOption(BarsOption::limited(2));
  REQUIRE (Engine::generate(catalog, spec).empty());
}
