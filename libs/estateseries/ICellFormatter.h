// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_ICELL_FORMATTER_H
#define __ESTATETREND_ICELL_FORMATTER_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace estatetrend
{
    /**
     * @brief Interface for rendering dates and values into pivot table cells.
     *
     * The pivot table builder is independent of the textual representation;
     * an implementation decides the date format and numeric precision.
     */
    class ICellFormatter
    {
    public:
        virtual ~ICellFormatter() = default;

        /**
         * @brief Renders the date column cell for an event on the given day.
         */
        virtual std::string formatDate(const boost::gregorian::date& aDate) const = 0;

        /**
         * @brief Renders a sale price or reference average price.
         */
        virtual std::string formatPrice(long price) const = 0;

        /**
         * @brief Renders a percentage difference value.
         */
        virtual std::string formatPercent(double percent) const = 0;
    };
}

#endif
