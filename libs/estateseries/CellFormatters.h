// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_CELL_FORMATTERS_H
#define __ESTATETREND_CELL_FORMATTERS_H 1

#include "ICellFormatter.h"
#include <iomanip>
#include <sstream>

namespace estatetrend
{
    /**
     * @brief Formatter used for the chart tables.
     *
     * Dates are reported at month resolution as YYYY-MM-01 so that sale rows
     * and reference index rows line up on the same x axis value. Prices are
     * whole currency units and percentages use a fixed number of decimals
     * so repeated runs produce identical output.
     */
    class DefaultCellFormatter : public ICellFormatter
    {
    public:
        explicit DefaultCellFormatter(int percentPrecision = 4)
            : mPercentPrecision(percentPrecision)
        {}

        std::string formatDate(const boost::gregorian::date& aDate) const override
        {
            boost::gregorian::date monthStart(aDate.year(), aDate.month(), 1);
            return boost::gregorian::to_iso_extended_string(monthStart);
        }

        std::string formatPrice(long price) const override
        {
            return std::to_string(price);
        }

        std::string formatPercent(double percent) const override
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(mPercentPrecision) << percent;
            return out.str();
        }

    private:
        int mPercentPrecision;
    };
}

#endif
